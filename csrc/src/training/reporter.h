// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_TRAINING_REPORTER_H
#define LOCKSTEP_SRC_TRAINING_REPORTER_H

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "utilities/comm.h"

class TrainingRunLogger;

//! Destination of named scalar metrics. Only ever owned by rank 0.
class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;
    virtual void record(std::string_view name, double value, long step) = 0;
};

/**
 * @brief Gate for visible metric side effects.
 *
 * Exactly one worker (rank 0) gets an ActiveReporter; all others get a NullReporter.
 * The orchestrator queries active() once and caches it.
 */
class IReporter {
public:
    virtual ~IReporter() = default;
    virtual void report(std::string_view name, double value, long step) = 0;
    [[nodiscard]] virtual bool active() const = 0;
};

//! Forwards every report to its sink.
class ActiveReporter final : public IReporter {
public:
    explicit ActiveReporter(std::unique_ptr<IMetricsSink> sink);

    void report(std::string_view name, double value, long step) override;
    [[nodiscard]] bool active() const override { return true; }

private:
    std::unique_ptr<IMetricsSink> mSink;
};

//! Drops every report; never fails.
class NullReporter final : public IReporter {
public:
    void report(std::string_view, double, long) noexcept override {}
    [[nodiscard]] bool active() const override { return false; }
};

using SinkFactory = std::function<std::unique_ptr<IMetricsSink>()>;

/**
 * @brief Select the reporter for @p identity.
 *
 * @p sink_factory is only invoked on rank 0, so no other rank ever opens a run
 * directory or file.
 */
std::unique_ptr<IReporter> make_reporter(const WorkerIdentity& identity, const SinkFactory& sink_factory);

/**
 * @brief Step coordinate of a report at (@p epoch, @p step_in_epoch).
 *
 * Scalars are addressed per epoch and step-within-epoch; they are recorded at
 * `epoch * steps_per_epoch + step_in_epoch`. End-of-epoch values use (epoch + 1, 0).
 * An epoch without training steps still spans one step, so epoch coordinates stay
 * distinct and increasing.
 */
constexpr long report_step(int epoch, int step_in_epoch, long steps_per_epoch) {
    return static_cast<long>(epoch) * std::max(steps_per_epoch, 1L) + step_in_epoch;
}

/**
 * @brief Directory name of a run: "<MM-DD>/<HH:MM> <run>", from the local time @p now.
 */
std::string format_run_name(std::string_view run, std::chrono::system_clock::time_point now);

/**
 * @brief Appends scalar events as JSON lines to `<directory>/scalars.jsonl`.
 *
 * Each line is an object with `name`, `value`, `step` and `wall_time` (seconds since
 * the epoch). The directory is created on construction.
 */
class ScalarEventWriter final : public IMetricsSink {
public:
    explicit ScalarEventWriter(const std::filesystem::path& directory);

    void record(std::string_view name, double value, long step) override;

    [[nodiscard]] const std::filesystem::path& path() const { return mPath; }

private:
    std::filesystem::path mPath;
    std::ofstream mFile;
};

//! Writes scalars into the run log.
class LoggerSink final : public IMetricsSink {
public:
    explicit LoggerSink(TrainingRunLogger& logger) : mLogger(logger) {}
    void record(std::string_view name, double value, long step) override;

private:
    TrainingRunLogger& mLogger;
};

//! Forwards every record to all of its sinks, in order.
class TeeSink final : public IMetricsSink {
public:
    explicit TeeSink(std::vector<std::unique_ptr<IMetricsSink>> sinks) : mSinks(std::move(sinks)) {}
    void record(std::string_view name, double value, long step) override;

private:
    std::vector<std::unique_ptr<IMetricsSink>> mSinks;
};

#endif //LOCKSTEP_SRC_TRAINING_REPORTER_H
