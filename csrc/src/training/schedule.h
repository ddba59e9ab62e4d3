// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_TRAINING_SCHEDULE_H
#define LOCKSTEP_SRC_TRAINING_SCHEDULE_H

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

/**
 * @brief Interface for scalar schedules.
 *
 * A schedule maps an integer index (step or epoch, starting at 0) to a float value,
 * e.g. a learning-rate multiplier.
 */
class ISchedule {
public:
    /** @brief Virtual destructor. */
    virtual ~ISchedule() = default;

    /**
     * @brief Evaluate the schedule at a given index.
     * @param step Current step/epoch index (>= 0).
     * @return Scheduled value for the given index.
     */
    virtual float eval(int step) const = 0;

    /**
     * @brief Evaluate the schedule in double precision.
     *
     * Schedules whose values are not exact in float override this; the default widens eval().
     */
    virtual double eval_precise(int step) const { return eval(step); }
};

/**
 * @brief Per-epoch learning-rate multiplier for large-batch data-parallel SGD.
 *
 * Behavior:
 * - For epochs in [0, 5): gradual warmup, linear from 1/world_size towards 1.
 * - For epochs >= 5: multiplied by 0.1 for every milestone (30, 60, 80) that has been
 *   reached; a milestone counts from the epoch equal to it onwards.
 *
 * Pure and stateless, so every worker evaluates the same value for the same epoch.
 */
class WarmupMultiStepSchedule : public ISchedule {
public:
    static constexpr int kWarmupEpochs = 5;
    static constexpr std::array<int, 3> kMilestones = {30, 60, 80};
    static constexpr double kGamma = 0.1;

    explicit WarmupMultiStepSchedule(int world_size) : mWorldSize(world_size) {
        if (world_size <= 0) {
            throw std::invalid_argument("WarmupMultiStepSchedule: world size must be positive");
        }
    }

    float eval(int epoch) const override {
        return static_cast<float>(multiplier(epoch));
    }

    double eval_precise(int epoch) const override {
        return multiplier(epoch);
    }

    //! Full-precision multiplier for @p epoch.
    double multiplier(int epoch) const {
        if (epoch < 0) {
            throw std::invalid_argument("WarmupMultiStepSchedule: negative epoch " + std::to_string(epoch));
        }
        if (epoch < kWarmupEpochs) {
            const double inv_world_size = 1.0 / mWorldSize;
            return inv_world_size + (1.0 - inv_world_size) * epoch / kWarmupEpochs;
        }
        // number of milestones <= epoch (bisect_right)
        auto passed = std::upper_bound(kMilestones.begin(), kMilestones.end(), epoch) - kMilestones.begin();
        return std::pow(kGamma, static_cast<double>(passed));
    }

    [[nodiscard]] int world_size() const { return mWorldSize; }

private:
    int mWorldSize;
};

#endif //LOCKSTEP_SRC_TRAINING_SCHEDULE_H
