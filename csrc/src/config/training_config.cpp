// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/training_config.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "utilities/utils.h"

namespace {

template<typename T>
void read_value(const nlohmann::json& value, const std::string& key, const std::string& file_name, T& target) {
    try {
        target = value.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(fmt::format("Invalid value for '{}' in {}: {}", key, file_name, e.what()));
    }
}

using OptionSetter = std::function<void(const nlohmann::json&, const std::string&, const std::string&, TrainingOptions&)>;

template<typename T>
OptionSetter setter(T TrainingOptions::* member) {
    return [member](const nlohmann::json& value, const std::string& key, const std::string& file_name, TrainingOptions& options) {
        read_value(value, key, file_name, options.*member);
    };
}

const std::vector<std::pair<std::string, OptionSetter>>& option_keys() {
    static const std::vector<std::pair<std::string, OptionSetter>> keys = {
        {"data",           setter(&TrainingOptions::Dataset)},
        {"data-dir",       setter(&TrainingOptions::DataDir)},
        {"batch",          setter(&TrainingOptions::BatchSize)},
        {"epochs",         setter(&TrainingOptions::Epochs)},
        {"run",            setter(&TrainingOptions::RunName)},
        {"run-dir",        setter(&TrainingOptions::RunDir)},
        {"log-file",       setter(&TrainingOptions::LogFile)},
        {"debug",          setter(&TrainingOptions::Debug)},
        {"local_rank",     setter(&TrainingOptions::LocalRank)},
        {"from-rank",      setter(&TrainingOptions::FromRank)},
        {"gpus",           setter(&TrainingOptions::GPUs)},
        {"world-size",     setter(&TrainingOptions::WorldSizeHint)},
        {"report-every",   setter(&TrainingOptions::ReportEvery)},
        {"seed",           setter(&TrainingOptions::Seed)},
        {"check-lockstep", setter(&TrainingOptions::CheckLockstep)},
        {"num-workers",    setter(&TrainingOptions::NumWorkers)},
    };
    return keys;
}

} // namespace

std::string default_log_file() {
    return fmt::format("logs/%n-{:%FT%H_%M}.json", std::chrono::system_clock::now());
}

void apply_options_file(TrainingOptions& options, const std::string& file_name,
                        const std::function<bool(std::string_view key)>& is_overridden) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw std::runtime_error(fmt::format("could not open options file {}", file_name));
    }

    nlohmann::json config_json;
    try {
        config_json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(fmt::format("could not parse options file {}: {}", file_name, e.what()));
    }
    if (!config_json.is_object()) {
        throw std::runtime_error(fmt::format("options file {} must contain a JSON object", file_name));
    }

    const auto& keys = option_keys();
    for (const auto& [key, value] : config_json.items()) {
        auto found = std::find_if(keys.begin(), keys.end(), [&](const auto& entry) { return entry.first == key; });
        if (found == keys.end()) {
            throw std::runtime_error(fmt::format("unknown option '{}' in {}", key, file_name));
        }
        if (is_overridden && is_overridden(key)) {
            continue;
        }
        found->second(value, key, file_name, options);
    }
}

std::string resolve_log_file(const TrainingOptions& options) {
    return replace_all(options.LogFile, "%n", options.RunName.empty() ? "lockstep" : options.RunName);
}

TrainingConfig make_training_config(const TrainingOptions& options, const WorkerIdentity& identity) {
    if (options.BatchSize <= 0) {
        throw std::invalid_argument(fmt::format("batch size must be positive, got {}", options.BatchSize));
    }
    if (options.Epochs <= 0) {
        throw std::invalid_argument(fmt::format("number of epochs must be positive, got {}", options.Epochs));
    }
    if (options.ReportEvery <= 0) {
        throw std::invalid_argument(fmt::format("report interval must be positive, got {}", options.ReportEvery));
    }
    if (options.NumWorkers < 0) {
        throw std::invalid_argument(fmt::format("number of data loading workers must not be negative, got {}", options.NumWorkers));
    }
    if (options.WorldSizeHint < 0) {
        throw std::invalid_argument(fmt::format("world size hint must not be negative, got {}", options.WorldSizeHint));
    }
    if (options.WorldSizeHint != 0 && options.WorldSizeHint != identity.WorldSize) {
        throw std::invalid_argument(fmt::format("expected a world size of {}, but the process group has {} workers",
                                                options.WorldSizeHint, identity.WorldSize));
    }

    TrainingConfig config;
    config.BatchSize = options.BatchSize;
    config.EpochCount = options.Epochs;
    config.BaseLearningRate = kLearningRatePerSample * options.BatchSize * identity.WorldSize;
    config.Dataset = options.Dataset;
    config.WorldSizeHint = options.WorldSizeHint;
    config.ReportEvery = options.ReportEvery;
    config.CheckLockstep = options.CheckLockstep;
    config.Seed = options.Seed;
    return config;
}
