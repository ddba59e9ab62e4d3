// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "metrics.h"

#include <numeric>

#include <fmt/core.h>

#include "utilities/comm.h"

CorrectTotal count_correct(std::span<const float> scores, std::span<const int> labels, int classes) {
    if (classes <= 0) {
        throw std::invalid_argument(fmt::format("count_correct: invalid number of classes {}", classes));
    }
    if (scores.size() != labels.size() * static_cast<std::size_t>(classes)) {
        throw std::invalid_argument(fmt::format("count_correct: {} scores do not match {} labels x {} classes",
                                                scores.size(), labels.size(), classes));
    }

    CorrectTotal result;
    for (std::size_t i = 0; i < labels.size(); ++i) {
        const float* row = scores.data() + i * classes;
        int predicted = 0;
        for (int c = 1; c < classes; ++c) {
            if (row[c] > row[predicted]) {
                predicted = c;
            }
        }
        if (predicted == labels[i]) {
            ++result.Correct;
        }
    }
    result.Total = static_cast<std::int64_t>(labels.size());
    return result;
}

double accuracy(const CorrectTotal& counts) {
    if (counts.Total == 0) {
        throw MetricError("Cannot compute accuracy over zero samples");
    }
    return static_cast<double>(counts.Correct) / static_cast<double>(counts.Total);
}

CorrectTotal MetricReducer::world_counts(const CorrectTotal& local) {
    std::int64_t values[2] = {local.Correct, local.Total};
    mComm.all_reduce_sum(values, 2);
    return CorrectTotal{.Correct = values[0], .Total = values[1]};
}

double MetricReducer::world_accuracy(const CorrectTotal& local) {
    CorrectTotal global = world_counts(local);
    if (global.Total == 0) {
        throw MetricError("Cannot compute accuracy: no samples were evaluated on any worker");
    }
    return accuracy(global);
}

double MetricReducer::local_average(const std::vector<double>& values) {
    if (values.empty()) {
        throw MetricError("Cannot average an empty list of values");
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}
