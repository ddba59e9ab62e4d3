// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_TRAINING_CLASSIFIER_H
#define LOCKSTEP_SRC_TRAINING_CLASSIFIER_H

#include <cstdint>
#include <span>
#include <vector>

struct Batch;
class Communicator;

//! \brief Abstract data-parallel classifier.
//! \details Every worker holds a replica. backward() is a collective: it averages the
//! gradients over all workers before returning, so after step() all replicas are identical.
class IClassifier {
public:
    virtual ~IClassifier() = default;

    //! \brief Computes the scores for `batch`, row-major `batch.Size x num_classes()`.
    //! \details The batch is referenced by the following cross_entropy()/backward() calls and
    //! must stay alive until then.
    virtual std::span<const float> forward(const Batch& batch) = 0;

    //! Mean cross-entropy of the preceding forward() against the batch labels.
    virtual double cross_entropy() = 0;

    //! Accumulates the gradients of the preceding cross_entropy(), averaged over all workers.
    virtual void backward() = 0;

    //! Applies the accumulated gradients.
    virtual void step() = 0;
    virtual void zero_grad() = 0;

    virtual void set_learning_rate(double learning_rate) = 0;
    [[nodiscard]] virtual double learning_rate() const = 0;
    [[nodiscard]] virtual int num_classes() const = 0;
};

/**
 * @brief Stochastic gradient descent with momentum and L2 weight decay.
 *
 * Update per parameter p with gradient g:
 *   d   = g + weight_decay * p
 *   buf = d                          (first step)
 *   buf = momentum * buf + d         (afterwards)
 *   p  -= lr * buf
 */
class SGDOptimizer {
public:
    SGDOptimizer(double learning_rate, double momentum, double weight_decay);

    void step(std::span<float> params, std::span<const float> grads);

    void set_learning_rate(double learning_rate) { mLearningRate = learning_rate; }
    [[nodiscard]] double learning_rate() const { return mLearningRate; }
    [[nodiscard]] double momentum() const { return mMomentum; }
    [[nodiscard]] double weight_decay() const { return mWeightDecay; }

private:
    double mLearningRate;
    double mMomentum;
    double mWeightDecay;
    std::vector<float> mMomentumBuffer;
};

/**
 * @brief Softmax regression `scores = W x + b` on host memory.
 *
 * Parameters live in one flat buffer (weights `classes x features`, then bias), so the
 * gradient synchronization is a single all-reduce. The initial parameters are drawn from a
 * seeded uniform distribution on every worker and then broadcast from rank 0.
 */
class LinearClassifier final : public IClassifier {
public:
    LinearClassifier(int num_features, int num_classes, Communicator& comm, SGDOptimizer optimizer, std::uint64_t seed);

    std::span<const float> forward(const Batch& batch) override;
    double cross_entropy() override;
    void backward() override;
    void step() override;
    void zero_grad() override;

    void set_learning_rate(double learning_rate) override { mOptimizer.set_learning_rate(learning_rate); }
    [[nodiscard]] double learning_rate() const override { return mOptimizer.learning_rate(); }
    [[nodiscard]] int num_classes() const override { return mNumClasses; }
    [[nodiscard]] int num_features() const { return mNumFeatures; }

    [[nodiscard]] std::span<const float> parameters() const { return mParams; }
    [[nodiscard]] std::span<const float> gradients() const { return mGrads; }

private:
    int mNumFeatures;
    int mNumClasses;
    Communicator& mComm;
    SGDOptimizer mOptimizer;

    std::vector<float> mParams;
    std::vector<float> mGrads;

    // per-batch state
    const Batch* mBatch = nullptr;
    std::vector<float> mScores;
    std::vector<float> mScoreGrads;
    bool mHasLoss = false;
};

#endif //LOCKSTEP_SRC_TRAINING_CLASSIFIER_H
