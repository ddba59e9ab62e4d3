// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_TRAINING_METRICS_H
#define LOCKSTEP_SRC_TRAINING_METRICS_H

#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

class Communicator;

/// Raised when a metric cannot be computed, e.g. a ratio over zero samples.
class MetricError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! Top-1 prediction counts.
struct CorrectTotal {
    std::int64_t Correct = 0;
    std::int64_t Total = 0;

    CorrectTotal& operator+=(const CorrectTotal& other) {
        Correct += other.Correct;
        Total += other.Total;
        return *this;
    }
};

/**
 * @brief Count top-1 correct predictions in a batch.
 *
 * @param scores Row-major `labels.size() x classes` scores.
 * @param labels Target class per sample.
 * @param classes Number of classes (row length of @p scores).
 * @return Correct predictions and number of samples. Ties resolve to the lowest class index.
 */
CorrectTotal count_correct(std::span<const float> scores, std::span<const int> labels, int classes);

//! Correct / Total; throws MetricError if Total is zero.
double accuracy(const CorrectTotal& counts);

/**
 * @brief Combines per-worker partial metrics.
 *
 * Two shapes with different scope:
 *  - world_accuracy() sums (correct, total) over all workers, then divides. This is a
 *    collective: every worker must call it at the same point.
 *  - local_average() is the mean of per-batch values collected by this worker only.
 *    Nothing is exchanged.
 */
class MetricReducer {
public:
    explicit MetricReducer(Communicator& comm) : mComm(comm) {}

    //! Sums counts over all workers (collective).
    CorrectTotal world_counts(const CorrectTotal& local);

    //! Accuracy over the counts of all workers (collective); throws MetricError if no samples were seen anywhere.
    double world_accuracy(const CorrectTotal& local);

    //! Arithmetic mean of @p values; throws MetricError if empty.
    static double local_average(const std::vector<double>& values);

private:
    Communicator& mComm;
};

#endif //LOCKSTEP_SRC_TRAINING_METRICS_H
