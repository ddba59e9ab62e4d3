// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_CONFIG_TRAINING_CONFIG_H
#define LOCKSTEP_SRC_CONFIG_TRAINING_CONFIG_H

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "utilities/comm.h"

//! Default log file template, `logs/%n-<timestamp>.json`.
std::string default_log_file();

/**
 * @brief Mutable run options, as bound to the command line and the `--config` file.
 *
 * Field names follow the command line flags; the options file uses the flag names
 * (without leading dashes) as keys.
 */
struct TrainingOptions {
    /// Dataset identifier (`cifar10`, `cifar100`).
    std::string Dataset = "cifar10";
    /// Directory containing the extracted dataset archives.
    std::string DataDir = "data";
    /// Mini-batch size per worker.
    int BatchSize = 128;
    /// Number of epochs to train.
    int Epochs = 90;

    /// Human-readable run name; scalar events are only written if this is set.
    std::string RunName;
    /// Parent directory for scalar events of named runs.
    std::string RunDir = "runs";
    /// Log file template (%n expands to the run name). Empty disables the log file.
    std::string LogFile = default_log_file();
    /// Verbose console output.
    bool Debug = false;

    /// Legacy `--local_rank` argument; overrides the launcher's local rank if >= 0.
    int LocalRank = -1;
    /// Device index offset of this machine.
    int FromRank = 0;
    /// Number of local GPUs for the single-process launch (0 = all).
    int GPUs = 0;
    /// Expected world size (0 = accept any).
    int WorldSizeHint = 0;

    /// Report per-step scalars every N steps.
    int ReportEvery = 1;
    /// Seed of the sampler permutation and of the parameter initialization.
    std::uint64_t Seed = 0;
    /// Exchange and compare a tag before every collective.
    bool CheckLockstep = false;
    /// Data loading worker count; loading is synchronous, so this is only validated.
    int NumWorkers = 4;
};

/**
 * @brief Load options from a JSON object file into @p options.
 *
 * Keys that @p is_overridden reports as set on the command line are skipped, so command
 * line flags take precedence over the file.
 *
 * @throws std::runtime_error If the file cannot be read, is not a JSON object, contains an
 * unknown key, or a value has the wrong type.
 */
void apply_options_file(TrainingOptions& options, const std::string& file_name,
                        const std::function<bool(std::string_view key)>& is_overridden);

//! Log file path with %n replaced by the run name (or "lockstep" for unnamed runs).
std::string resolve_log_file(const TrainingOptions& options);

/**
 * @brief Immutable hyper-parameters of one training run.
 *
 * Constructed once at start by make_training_config() and never modified afterwards.
 */
struct TrainingConfig {
    int BatchSize = 1;
    int EpochCount = 1;
    double BaseLearningRate = 0.0;
    double Momentum = 0.9;
    double WeightDecay = 1e-4;
    std::string Dataset;
    int WorldSizeHint = 0;

    int ReportEvery = 1;
    bool CheckLockstep = false;
    std::uint64_t Seed = 0;
};

/// Learning rate per sample of the global batch.
constexpr double kLearningRatePerSample = 0.0004;

/**
 * @brief Validate @p options and derive the run configuration for the bootstrapped group.
 *
 * `BaseLearningRate = kLearningRatePerSample * batch_size * world_size`.
 *
 * @throws std::invalid_argument On non-positive sizes, or if a world size hint is given
 * and differs from the actual world size.
 */
TrainingConfig make_training_config(const TrainingOptions& options, const WorkerIdentity& identity);

#endif //LOCKSTEP_SRC_CONFIG_TRAINING_CONFIG_H
