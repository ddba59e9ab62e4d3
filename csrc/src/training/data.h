// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_TRAINING_DATA_H
#define LOCKSTEP_SRC_TRAINING_DATA_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

//! One mini-batch; Inputs is row-major `Size x Features`.
struct Batch {
    std::vector<float> Inputs;
    std::vector<int> Labels;
    int Size = 0;
    int Features = 0;
};

//! Random-access labelled samples.
class IDataset {
public:
    virtual ~IDataset() = default;
    [[nodiscard]] virtual std::size_t size() const = 0;
    [[nodiscard]] virtual int num_features() const = 0;
    [[nodiscard]] virtual int num_classes() const = 0;
    //! Copies sample @p index into @p features (num_features() floats) and returns its label.
    virtual int fetch(std::size_t index, float* features) const = 0;
};

/*!
 * \brief Dataset fully held in host memory.
 */
class InMemoryDataset : public IDataset {
public:
    InMemoryDataset(int num_features, int num_classes, std::vector<float> features, std::vector<int> labels);

    [[nodiscard]] std::size_t size() const override { return mLabels.size(); }
    [[nodiscard]] int num_features() const override { return mNumFeatures; }
    [[nodiscard]] int num_classes() const override { return mNumClasses; }
    int fetch(std::size_t index, float* features) const override;

private:
    int mNumFeatures;
    int mNumClasses;
    std::vector<float> mFeatures;
    std::vector<int> mLabels;
};

/**
 * @brief Square images of another dataset, resized when a sample is fetched.
 *
 * Samples are channel-major `channels x side x side`. Resizing is bilinear with
 * half-pixel centers, edges clamped.
 */
class ResizedImageDataset : public IDataset {
public:
    ResizedImageDataset(std::unique_ptr<IDataset> images, int channels, int side, int resized_side);

    [[nodiscard]] std::size_t size() const override { return mImages->size(); }
    [[nodiscard]] int num_features() const override { return mChannels * mResizedSide * mResizedSide; }
    [[nodiscard]] int num_classes() const override { return mImages->num_classes(); }
    int fetch(std::size_t index, float* features) const override;

private:
    struct Tap {
        int Low;
        int High;
        float Weight;   // of High
    };

    std::unique_ptr<IDataset> mImages;
    int mChannels;
    int mSide;
    int mResizedSide;
    std::vector<Tap> mTaps;     // same for rows and columns
};

/*!
 * \brief Partitions sample indices between the workers of a process group.
 * \details Every epoch the full index range is (optionally) permuted with a generator seeded
 * by `seed + epoch`, padded by wrapping around to a multiple of the world size, and rank `r`
 * takes the indices at positions r, r + world_size, r + 2 * world_size, ...
 * All workers therefore get the same number of samples, and together they cover every sample
 * at least once per epoch.
 */
class DistributedSampler {
public:
    DistributedSampler(std::size_t dataset_size, int rank, int world_size, bool shuffle = true, std::uint64_t seed = 0);

    //! Re-seed the permutation; must be called with the same value on every worker.
    void set_epoch(int epoch) { mEpoch = epoch; }

    //! Indices of this rank for the current epoch.
    [[nodiscard]] std::vector<std::size_t> indices() const;

    //! Number of indices per rank (ceil(dataset_size / world_size)).
    [[nodiscard]] std::size_t num_samples() const { return mNumSamples; }
    [[nodiscard]] int epoch() const { return mEpoch; }

private:
    std::size_t mDatasetSize;
    int mRank;
    int mWorldSize;
    bool mShuffle;
    std::uint64_t mSeed;
    int mEpoch = 0;
    std::size_t mNumSamples;
};

/**
 * @brief Source of mini-batches for one pass over a (possibly sharded) dataset.
 *
 * Exhausted after one pass; reshard() restarts it for the given epoch.
 */
class IBatchStream {
public:
    virtual ~IBatchStream() = default;
    virtual void reshard(int epoch) = 0;
    virtual std::optional<Batch> next_batch() = 0;
    //! Number of batches one pass yields.
    [[nodiscard]] virtual std::size_t num_batches() const = 0;
};

/**
 * @brief Batches samples of a dataset in sampler order (or sequential order without sampler).
 *
 * With @p drop_last, a trailing partial batch is skipped.
 */
class DataLoader : public IBatchStream {
public:
    DataLoader(const IDataset& dataset, int batch_size, bool drop_last, std::optional<DistributedSampler> sampler = std::nullopt);

    void reshard(int epoch) override;
    std::optional<Batch> next_batch() override;
    [[nodiscard]] std::size_t num_batches() const override;

    //! Samples one pass visits.
    [[nodiscard]] std::size_t num_samples() const;
    [[nodiscard]] int batch_size() const { return mBatchSize; }
    [[nodiscard]] const IDataset& dataset() const { return mDataset; }

private:
    const IDataset& mDataset;
    int mBatchSize;
    bool mDropLast;
    std::optional<DistributedSampler> mSampler;

    // state
    std::vector<std::size_t> mOrder;
    std::size_t mPosition = 0;
};

//! Dataset identifiers accepted on the command line.
const std::vector<std::string>& known_datasets();

//! Train and validation splits of a named dataset.
struct DatasetSplits {
    std::unique_ptr<IDataset> Train;
    std::unique_ptr<IDataset> Valid;
};

/**
 * @brief Load the CIFAR-10 / CIFAR-100 binary distribution from @p data_dir.
 *
 * Expects `cifar-10-batches-bin/{data_batch_1..5,test_batch}.bin` or
 * `cifar-100-binary/{train,test}.bin` below @p data_dir. Pixels are scaled to [0, 1] and
 * normalized per channel. The `-224` variants read the same files and upscale every
 * image to 224 x 224.
 *
 * @throws std::runtime_error If a file is missing or truncated.
 */
DatasetSplits load_cifar(const std::string& data_dir, const std::string& name);

#endif //LOCKSTEP_SRC_TRAINING_DATA_H
