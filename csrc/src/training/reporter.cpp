// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "reporter.h"

#include <ctime>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "logging.h"

ActiveReporter::ActiveReporter(std::unique_ptr<IMetricsSink> sink) : mSink(std::move(sink)) {
    if (!mSink) {
        throw std::invalid_argument("ActiveReporter requires a metrics sink");
    }
}

void ActiveReporter::report(std::string_view name, double value, long step) {
    mSink->record(name, value, step);
}

std::unique_ptr<IReporter> make_reporter(const WorkerIdentity& identity, const SinkFactory& sink_factory) {
    if (identity.Rank != 0) {
        return std::make_unique<NullReporter>();
    }
    return std::make_unique<ActiveReporter>(sink_factory());
}

std::string format_run_name(std::string_view run, std::chrono::system_clock::time_point now) {
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    return fmt::format("{:%m-%d/%H:%M} {}", local, run);
}

ScalarEventWriter::ScalarEventWriter(const std::filesystem::path& directory) : mPath(directory / "scalars.jsonl") {
    std::filesystem::create_directories(directory);
    mFile.open(mPath, std::ios::out | std::ios::app);
    if (!mFile.is_open()) {
        throw std::runtime_error(fmt::format("Could not open scalar event file {}", mPath.string()));
    }
}

void ScalarEventWriter::record(std::string_view name, double value, long step) {
    auto wall_time = std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
    nlohmann::json event = {
        {"name", std::string(name)},
        {"value", value},
        {"step", step},
        {"wall_time", wall_time}
    };
    mFile << event.dump() << std::endl;
}

void LoggerSink::record(std::string_view name, double value, long step) {
    mLogger.log_scalar(name, value, step);
}

void TeeSink::record(std::string_view name, double value, long step) {
    for (auto& sink : mSinks) {
        sink->record(name, value, step);
    }
}
