// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "classifier.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

#include <fmt/core.h>

#include "data.h"
#include "utilities/comm.h"

SGDOptimizer::SGDOptimizer(double learning_rate, double momentum, double weight_decay) :
    mLearningRate(learning_rate), mMomentum(momentum), mWeightDecay(weight_decay)
{
    if (learning_rate < 0 || momentum < 0 || weight_decay < 0) {
        throw std::invalid_argument(fmt::format("SGDOptimizer: invalid hyper-parameters lr={} momentum={} weight_decay={}",
                                                learning_rate, momentum, weight_decay));
    }
}

void SGDOptimizer::step(std::span<float> params, std::span<const float> grads) {
    if (params.size() != grads.size()) {
        throw std::invalid_argument(fmt::format("SGDOptimizer: {} parameters but {} gradients", params.size(), grads.size()));
    }

    const bool first_step = mMomentumBuffer.empty();
    if (first_step) {
        mMomentumBuffer.resize(params.size());
    } else if (mMomentumBuffer.size() != params.size()) {
        throw std::logic_error("SGDOptimizer: parameter count changed between steps");
    }

    const auto lr = static_cast<float>(mLearningRate);
    const auto momentum = static_cast<float>(mMomentum);
    const auto weight_decay = static_cast<float>(mWeightDecay);
    for (std::size_t i = 0; i < params.size(); ++i) {
        float d = grads[i] + weight_decay * params[i];
        float buf = (first_step || momentum == 0.f) ? d : momentum * mMomentumBuffer[i] + d;
        mMomentumBuffer[i] = buf;
        params[i] -= lr * buf;
    }
}

// ----------------------------------------------------------------------------

LinearClassifier::LinearClassifier(int num_features, int num_classes, Communicator& comm, SGDOptimizer optimizer, std::uint64_t seed) :
    mNumFeatures(num_features), mNumClasses(num_classes), mComm(comm), mOptimizer(std::move(optimizer))
{
    if (num_features <= 0 || num_classes <= 1) {
        throw std::invalid_argument(fmt::format("LinearClassifier: invalid shape ({} features, {} classes)", num_features, num_classes));
    }

    const std::size_t count = static_cast<std::size_t>(num_classes) * (num_features + 1);
    mParams.resize(count);
    mGrads.assign(count, 0.f);

    // same bound as the default initialization of a torch Linear layer
    const float bound = 1.f / std::sqrt(static_cast<float>(num_features));
    std::mt19937_64 rng{seed};
    std::uniform_real_distribution<float> dist(-bound, bound);
    std::generate(mParams.begin(), mParams.end(), [&]() { return dist(rng); });

    mComm.check_lockstep(LockstepTag{.Epoch = 0, .Step = 0, .Op = ECollective::ParameterBroadcast});
    mComm.broadcast(mParams.data(), mParams.size(), 0);
}

std::span<const float> LinearClassifier::forward(const Batch& batch) {
    if (batch.Features != mNumFeatures) {
        throw std::invalid_argument(fmt::format("LinearClassifier: batch has {} features, model expects {}", batch.Features, mNumFeatures));
    }
    mBatch = &batch;
    mHasLoss = false;

    const float* weights = mParams.data();
    const float* bias = mParams.data() + static_cast<std::size_t>(mNumClasses) * mNumFeatures;
    mScores.resize(static_cast<std::size_t>(batch.Size) * mNumClasses);
    for (int i = 0; i < batch.Size; ++i) {
        const float* x = batch.Inputs.data() + static_cast<std::size_t>(i) * mNumFeatures;
        for (int c = 0; c < mNumClasses; ++c) {
            const float* w = weights + static_cast<std::size_t>(c) * mNumFeatures;
            float acc = bias[c];
            for (int f = 0; f < mNumFeatures; ++f) {
                acc += w[f] * x[f];
            }
            mScores[static_cast<std::size_t>(i) * mNumClasses + c] = acc;
        }
    }
    return mScores;
}

/**
 * @brief Mean cross-entropy over the batch, using a max-shifted log-softmax.
 *
 * Also stores d(loss)/d(scores) = (softmax - onehot) / batch_size for backward().
 */
double LinearClassifier::cross_entropy() {
    if (!mBatch) {
        throw std::logic_error("LinearClassifier: cross_entropy() called before forward()");
    }
    const int size = mBatch->Size;
    if (size == 0) {
        throw std::invalid_argument("LinearClassifier: cross_entropy() of an empty batch");
    }

    mScoreGrads.resize(mScores.size());
    double total = 0.0;
    for (int i = 0; i < size; ++i) {
        const float* row = mScores.data() + static_cast<std::size_t>(i) * mNumClasses;
        float* grad = mScoreGrads.data() + static_cast<std::size_t>(i) * mNumClasses;
        const int label = mBatch->Labels[i];

        const float max_score = *std::max_element(row, row + mNumClasses);
        double sum = 0.0;
        for (int c = 0; c < mNumClasses; ++c) {
            sum += std::exp(static_cast<double>(row[c] - max_score));
        }
        const double log_sum = std::log(sum);
        total += log_sum - static_cast<double>(row[label] - max_score);

        for (int c = 0; c < mNumClasses; ++c) {
            double p = std::exp(static_cast<double>(row[c] - max_score) - log_sum);
            grad[c] = static_cast<float>((p - (c == label ? 1.0 : 0.0)) / size);
        }
    }
    mHasLoss = true;
    return total / size;
}

void LinearClassifier::backward() {
    if (!mHasLoss) {
        throw std::logic_error("LinearClassifier: backward() called without a preceding cross_entropy()");
    }

    std::vector<float> local(mGrads.size(), 0.f);
    float* weight_grads = local.data();
    float* bias_grads = local.data() + static_cast<std::size_t>(mNumClasses) * mNumFeatures;
    for (int i = 0; i < mBatch->Size; ++i) {
        const float* x = mBatch->Inputs.data() + static_cast<std::size_t>(i) * mNumFeatures;
        const float* dscore = mScoreGrads.data() + static_cast<std::size_t>(i) * mNumClasses;
        for (int c = 0; c < mNumClasses; ++c) {
            float* w = weight_grads + static_cast<std::size_t>(c) * mNumFeatures;
            for (int f = 0; f < mNumFeatures; ++f) {
                w[f] += dscore[c] * x[f];
            }
            bias_grads[c] += dscore[c];
        }
    }

    // gradient synchronization across all replicas
    mComm.all_reduce_avg(local.data(), local.size());
    std::transform(mGrads.begin(), mGrads.end(), local.begin(), mGrads.begin(), std::plus<>());
}

void LinearClassifier::step() {
    mOptimizer.step(mParams, mGrads);
}

void LinearClassifier::zero_grad() {
    std::fill(mGrads.begin(), mGrads.end(), 0.f);
}
