// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "data.h"

#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/utils.h"

InMemoryDataset::InMemoryDataset(int num_features, int num_classes, std::vector<float> features, std::vector<int> labels) :
    mNumFeatures(num_features), mNumClasses(num_classes), mFeatures(std::move(features)), mLabels(std::move(labels))
{
    if (mNumFeatures <= 0 || mNumClasses <= 0) {
        throw std::invalid_argument(fmt::format("InMemoryDataset: invalid shape ({} features, {} classes)", mNumFeatures, mNumClasses));
    }
    if (mFeatures.size() != mLabels.size() * static_cast<std::size_t>(mNumFeatures)) {
        throw std::invalid_argument(fmt::format("InMemoryDataset: {} feature values do not match {} samples of {} features",
                                                mFeatures.size(), mLabels.size(), mNumFeatures));
    }
    for (std::size_t i = 0; i < mLabels.size(); ++i) {
        if (mLabels[i] < 0 || mLabels[i] >= mNumClasses) {
            throw std::invalid_argument(fmt::format("InMemoryDataset: label {} of sample {} outside of [0, {})", mLabels[i], i, mNumClasses));
        }
    }
}

int InMemoryDataset::fetch(std::size_t index, float* features) const {
    if (index >= mLabels.size()) {
        throw std::out_of_range(fmt::format("InMemoryDataset: sample {} requested, dataset has {}", index, mLabels.size()));
    }
    const float* src = mFeatures.data() + index * mNumFeatures;
    std::copy(src, src + mNumFeatures, features);
    return mLabels[index];
}

// ----------------------------------------------------------------------------

ResizedImageDataset::ResizedImageDataset(std::unique_ptr<IDataset> images, int channels, int side, int resized_side) :
    mImages(std::move(images)), mChannels(channels), mSide(side), mResizedSide(resized_side)
{
    if (!mImages) {
        throw std::invalid_argument("ResizedImageDataset: no source dataset");
    }
    if (mChannels <= 0 || mSide <= 0 || mResizedSide <= 0) {
        throw std::invalid_argument(fmt::format("ResizedImageDataset: invalid shape {} x {} -> {}", mChannels, mSide, mResizedSide));
    }
    if (mImages->num_features() != mChannels * mSide * mSide) {
        throw std::invalid_argument(fmt::format("ResizedImageDataset: source has {} features, expected {} x {} x {}",
                                                mImages->num_features(), mChannels, mSide, mSide));
    }

    const double scale = static_cast<double>(mSide) / mResizedSide;
    mTaps.reserve(mResizedSide);
    for (int dst = 0; dst < mResizedSide; ++dst) {
        const double src = std::max((dst + 0.5) * scale - 0.5, 0.0);
        const int low = std::min(static_cast<int>(src), mSide - 1);
        const int high = std::min(low + 1, mSide - 1);
        mTaps.push_back(Tap{low, high, static_cast<float>(src - low)});
    }
}

int ResizedImageDataset::fetch(std::size_t index, float* features) const {
    std::vector<float> image(static_cast<std::size_t>(mImages->num_features()));
    const int label = mImages->fetch(index, image.data());

    const std::size_t plane = static_cast<std::size_t>(mSide) * mSide;
    for (int c = 0; c < mChannels; ++c) {
        const float* src = image.data() + c * plane;
        for (int y = 0; y < mResizedSide; ++y) {
            const Tap& row = mTaps[y];
            const float* top = src + static_cast<std::size_t>(row.Low) * mSide;
            const float* bottom = src + static_cast<std::size_t>(row.High) * mSide;
            for (int x = 0; x < mResizedSide; ++x) {
                const Tap& col = mTaps[x];
                const float upper = top[col.Low] + col.Weight * (top[col.High] - top[col.Low]);
                const float lower = bottom[col.Low] + col.Weight * (bottom[col.High] - bottom[col.Low]);
                *features++ = upper + row.Weight * (lower - upper);
            }
        }
    }
    return label;
}

// ----------------------------------------------------------------------------

DistributedSampler::DistributedSampler(std::size_t dataset_size, int rank, int world_size, bool shuffle, std::uint64_t seed) :
    mDatasetSize(dataset_size), mRank(rank), mWorldSize(world_size), mShuffle(shuffle), mSeed(seed)
{
    if (world_size <= 0 || rank < 0 || rank >= world_size) {
        throw std::invalid_argument(fmt::format("DistributedSampler: invalid rank {} for world size {}", rank, world_size));
    }
    mNumSamples = div_ceil(mDatasetSize, static_cast<std::size_t>(mWorldSize));
}

/**
 * @brief Indices of this rank for the current epoch.
 *
 * The permutation only depends on (seed, epoch), so all ranks compute the same one and
 * take disjoint strided slices of it.
 */
std::vector<std::size_t> DistributedSampler::indices() const {
    std::vector<std::size_t> order(mDatasetSize);
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (mShuffle) {
        std::ranges::shuffle(order, std::mt19937_64{mSeed + static_cast<std::uint64_t>(mEpoch)});
    }

    std::vector<std::size_t> result;
    if (mDatasetSize == 0) {
        return result;
    }
    result.reserve(mNumSamples);
    const std::size_t total = mNumSamples * mWorldSize;
    for (std::size_t i = mRank; i < total; i += mWorldSize) {
        // positions past the end wrap around to the start of the permutation
        result.push_back(order[i % mDatasetSize]);
    }
    return result;
}

// ----------------------------------------------------------------------------

DataLoader::DataLoader(const IDataset& dataset, int batch_size, bool drop_last, std::optional<DistributedSampler> sampler) :
    mDataset(dataset), mBatchSize(batch_size), mDropLast(drop_last), mSampler(std::move(sampler))
{
    if (mBatchSize <= 0) {
        throw std::invalid_argument(fmt::format("DataLoader: batch size must be positive, got {}", mBatchSize));
    }
    reshard(0);
}

void DataLoader::reshard(int epoch) {
    if (mSampler) {
        mSampler->set_epoch(epoch);
        mOrder = mSampler->indices();
    } else {
        mOrder.resize(mDataset.size());
        std::iota(mOrder.begin(), mOrder.end(), std::size_t{0});
    }
    mPosition = 0;
}

std::size_t DataLoader::num_samples() const {
    return mSampler ? mSampler->num_samples() : mDataset.size();
}

std::size_t DataLoader::num_batches() const {
    const std::size_t samples = num_samples();
    const auto batch = static_cast<std::size_t>(mBatchSize);
    return mDropLast ? samples / batch : div_ceil(samples, batch);
}

std::optional<Batch> DataLoader::next_batch() {
    const std::size_t remaining = mOrder.size() - mPosition;
    if (remaining == 0 || (mDropLast && remaining < static_cast<std::size_t>(mBatchSize))) {
        return std::nullopt;
    }

    const int size = static_cast<int>(std::min<std::size_t>(remaining, mBatchSize));
    const int features = mDataset.num_features();
    Batch batch;
    batch.Size = size;
    batch.Features = features;
    batch.Inputs.resize(static_cast<std::size_t>(size) * features);
    batch.Labels.resize(size);
    for (int i = 0; i < size; ++i) {
        batch.Labels[i] = mDataset.fetch(mOrder[mPosition + i], batch.Inputs.data() + static_cast<std::size_t>(i) * features);
    }
    mPosition += size;
    return batch;
}
