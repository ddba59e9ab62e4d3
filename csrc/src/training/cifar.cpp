// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "data.h"

#include <array>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string_view>

#include <fmt/core.h>

namespace {

constexpr int kImageSide = 32;
constexpr int kChannels = 3;
constexpr int kPixels = kImageSide * kImageSide;
constexpr int kImageBytes = kChannels * kPixels;
constexpr int kUpscaledSide = 224;
constexpr std::string_view kUpscaledSuffix = "-224";

struct CifarLayout {
    const char* Directory;
    std::vector<const char*> TrainFiles;
    const char* TestFile;
    int LabelBytes;     // CIFAR-100 prefixes a coarse label
    int Classes;
    std::array<float, kChannels> Mean;
    std::array<float, kChannels> Std;
};

const CifarLayout& layout_for(const std::string& name) {
    static const CifarLayout cifar10{
        "cifar-10-batches-bin",
        {"data_batch_1.bin", "data_batch_2.bin", "data_batch_3.bin", "data_batch_4.bin", "data_batch_5.bin"},
        "test_batch.bin", 1, 10,
        {0.4914f, 0.4822f, 0.4465f}, {0.2470f, 0.2435f, 0.2616f}};
    static const CifarLayout cifar100{
        "cifar-100-binary", {"train.bin"}, "test.bin", 2, 100,
        {0.5071f, 0.4865f, 0.4409f}, {0.2673f, 0.2564f, 0.2762f}};

    if (name == "cifar10") return cifar10;
    if (name == "cifar100") return cifar100;
    throw std::invalid_argument(fmt::format("Unknown dataset '{}'", name));
}

void read_records(const std::filesystem::path& file, const CifarLayout& layout, std::vector<float>& features, std::vector<int>& labels) {
    std::ifstream in(file, std::ios::binary);
    if (!in) {
        throw std::runtime_error(fmt::format("Could not open CIFAR file {}", file.string()));
    }
    in.seekg(0, std::ios::end);
    const auto file_size = static_cast<std::size_t>(in.tellg());
    in.seekg(0, std::ios::beg);

    const std::size_t record_size = layout.LabelBytes + kImageBytes;
    if (file_size == 0 || file_size % record_size != 0) {
        throw std::runtime_error(fmt::format("CIFAR file {} has {} bytes, which is not a multiple of the {}-byte record size",
                                             file.string(), file_size, record_size));
    }

    std::vector<unsigned char> record(record_size);
    const std::size_t records = file_size / record_size;
    for (std::size_t r = 0; r < records; ++r) {
        if (!in.read(reinterpret_cast<char*>(record.data()), static_cast<std::streamsize>(record_size))) {
            throw std::runtime_error(fmt::format("Truncated read in {} at offset {}", file.string(), r * record_size));
        }
        // the fine label is the last label byte
        const int label = record[layout.LabelBytes - 1];
        if (label >= layout.Classes) {
            throw std::runtime_error(fmt::format("Invalid label {} in {} at offset {}", label, file.string(), r * record_size));
        }
        labels.push_back(label);

        const unsigned char* pixels = record.data() + layout.LabelBytes;
        for (int c = 0; c < kChannels; ++c) {
            for (int p = 0; p < kPixels; ++p) {
                float value = static_cast<float>(pixels[c * kPixels + p]) / 255.f;
                features.push_back((value - layout.Mean[c]) / layout.Std[c]);
            }
        }
    }
}

std::unique_ptr<InMemoryDataset> load_split(const std::filesystem::path& dir, const CifarLayout& layout, const std::vector<const char*>& files) {
    std::vector<float> features;
    std::vector<int> labels;
    for (const char* file : files) {
        read_records(dir / file, layout, features, labels);
    }
    return std::make_unique<InMemoryDataset>(kImageBytes, layout.Classes, std::move(features), std::move(labels));
}

} // namespace

const std::vector<std::string>& known_datasets() {
    static const std::vector<std::string> names = {"cifar10", "cifar100", "cifar10-224", "cifar100-224"};
    return names;
}

DatasetSplits load_cifar(const std::string& data_dir, const std::string& name) {
    const bool upscale = name.ends_with(kUpscaledSuffix);
    const CifarLayout& layout = layout_for(upscale ? name.substr(0, name.size() - kUpscaledSuffix.size()) : name);
    const std::filesystem::path dir = std::filesystem::path(data_dir) / layout.Directory;
    if (!std::filesystem::is_directory(dir)) {
        throw std::runtime_error(fmt::format("Dataset directory {} does not exist", dir.string()));
    }

    DatasetSplits splits;
    splits.Train = load_split(dir, layout, layout.TrainFiles);
    splits.Valid = load_split(dir, layout, {layout.TestFile});
    if (upscale) {
        splits.Train = std::make_unique<ResizedImageDataset>(std::move(splits.Train), kChannels, kImageSide, kUpscaledSide);
        splits.Valid = std::make_unique<ResizedImageDataset>(std::move(splits.Valid), kChannels, kImageSide, kUpscaledSide);
    }
    return splits;
}
