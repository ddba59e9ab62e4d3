// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "training/data.h"
#include "training/reporter.h"
#include "utilities/comm.h"

namespace testing_utils {

/**
 * @brief Run @p fn on @p world simulated ranks and collect one result per rank.
 *
 * Catch2 assertions are not thread safe, so tests compute per-rank values inside the
 * workers and check them on the main thread afterwards.
 */
template<typename T>
std::vector<T> run_ranks(int world, const std::function<T(Communicator&)>& fn) {
    std::vector<T> results(world);
    Communicator::run_host_communicators(world, [&](Communicator& comm) {
        results[comm.rank()] = fn(comm);
    });
    return results;
}

//! Dataset with @p features features per sample where sample i has all features equal to `i`.
inline InMemoryDataset make_indexed_dataset(int samples, int features, const std::vector<int>& labels, int classes) {
    std::vector<float> values;
    values.reserve(static_cast<std::size_t>(samples) * features);
    for (int i = 0; i < samples; ++i) {
        for (int f = 0; f < features; ++f) {
            values.push_back(static_cast<float>(i));
        }
    }
    return InMemoryDataset(features, classes, std::move(values), labels);
}

//! Random dataset; labels are drawn uniformly from [0, classes).
inline InMemoryDataset make_random_dataset(int samples, int features, int classes, std::uint64_t seed) {
    std::mt19937_64 rng{seed};
    std::normal_distribution<float> feature_dist(0.f, 1.f);
    std::uniform_int_distribution<int> label_dist(0, classes - 1);
    std::vector<float> values(static_cast<std::size_t>(samples) * features);
    std::vector<int> labels(samples);
    for (auto& v : values) v = feature_dist(rng);
    for (auto& l : labels) l = label_dist(rng);
    return InMemoryDataset(features, classes, std::move(values), std::move(labels));
}

//! Metrics sink that keeps every record.
class RecordingSink : public IMetricsSink {
public:
    struct Record {
        std::string Name;
        double Value;
        long Step;
    };

    explicit RecordingSink(std::vector<Record>& records) : mRecords(records) {}

    void record(std::string_view name, double value, long step) override {
        mRecords.push_back(Record{std::string(name), value, step});
    }

private:
    std::vector<Record>& mRecords;
};

//! Unique directory below the system temp directory, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        mPath = std::filesystem::temp_directory_path() /
                ("lockstep-test-" + std::to_string(stamp) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(mPath);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(mPath, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return mPath; }

private:
    std::filesystem::path mPath;
};

} // namespace testing_utils
