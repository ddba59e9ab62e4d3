// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>
#include <fmt/chrono.h>
#include <nlohmann/json.hpp>

#include "utilities/gpu_info.h"

namespace {

//! Quoted and escaped JSON string literal.
std::string json_str(std::string_view text) {
    return nlohmann::json(std::string(text)).dump();
}

}

/**
 * @brief Create a logger that writes a JSON array to @p file_name (rank 0 only).
 *
 * On rank 0, ensures the parent directory exists, opens the file for output,
 * and initializes it as a JSON array (writes "[ ... ]"). An empty @p file_name
 * disables the file; console output is unaffected.
 *
 * @param file_name Output path for the JSON log.
 * @param rank Worker rank; only rank 0 writes the JSON file and prints.
 * @param verbosity Verbosity level controlling stdout printing.
 *
 * @throws std::runtime_error If the log file cannot be created.
 */
TrainingRunLogger::TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity) :
    mFileName(file_name), mRank(rank), mVerbosity(verbosity)
{
    if(mRank == 0 && !mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::filesystem::create_directories(log_path);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile.is_open()) {
            throw std::runtime_error(fmt::format("Could not open log file {}", mFileName));
        }
        mLogFile << "[\n";
        mLogFile << "\n]\n" << std::flush;
    }
}

/**
 * @brief Destructor; closes the log file if open.
 */
TrainingRunLogger::~TrainingRunLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

/**
 * @brief Log configuration options (rank 0 only).
 *
 * Each option is written as a JSON log line; with VERBOSE output they are also printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void TrainingRunLogger::log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options) {
    if(mRank != 0) return;

    int option_length = 0;
    for(auto& [name, value]: options) {
        option_length = std::max(option_length, static_cast<int>(name.size()));
    }

    if(mVerbosity >= 1) {
        printf("[Options]\n");
    }
    for(auto& [name, value]: options) {
        auto log = [&](auto&& v){
            using value_t = std::remove_cvref_t<decltype(v)>;
            if constexpr (std::is_same_v<value_t, std::string>) {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, json_str(v)));
                if(mVerbosity >= 1) printf("  %-*s : %s\n", option_length, std::string(name).c_str(), v.c_str());
            } else {
                log_line(fmt::format(R"(  {{"log": "option", "time": "{}", "step": 0, "name": "{}", "value": {}}})",
                                     std::chrono::system_clock::now(), name, v));
                if(mVerbosity >= 1) printf("  %-*s : %s\n", option_length, std::string(name).c_str(), fmt::format("{}", v).c_str());
            }
        };
        std::visit(log, value);
    }
    if(mVerbosity >= 1) {
        printf("\n");
    }
}

/**
 * @brief Log the devices of all ranks (rank 0 only).
 *
 * @param devices Per-rank device descriptions, as returned by gather_device_info().
 */
void TrainingRunLogger::log_devices(const std::vector<DeviceInfo>& devices)
{
    if(mRank != 0) return;
    for (auto& d: devices) {
        log_line(fmt::format(
            R"(  {{"log": "device", "time": "{}", "rank": {}, "step": 0, "id": {}, "name": {}, "major": {}, "minor": {}, "memory": {}, "free": {}, "cuda_driver": {}, "cuda_runtime": {}, "nccl": {}}})",
            std::chrono::system_clock::now(), d.rank, d.device_id, json_str(d.name), d.major, d.minor,
            d.mem_total, d.mem_free, d.driver_version, d.runtime_version, d.nccl_version));

        if(mVerbosity >= 1 || (mVerbosity >= 0 && d.rank == 0)) {
            printf("[System %d]\n", d.rank);
            printf("  Device %d: %s (sm_%d%d)\n", d.device_id, d.name, d.major, d.minor);
            printf("  CUDA version: driver %d, runtime %d, NCCL %d\n", d.driver_version, d.runtime_version, d.nccl_version);
            printf("  Memory: %zu MiB / %zu MiB\n", (d.mem_total-d.mem_free) / 1024 / 1024, d.mem_total / 1024 / 1024);
            printf("\n");
        }
    }
}

void TrainingRunLogger::log_dataset(std::string_view name, long train_samples, long valid_samples, long train_batches, long valid_batches) {
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "dataset", "time": "{}", "step": 0, "name": {}, "train_samples": {}, "valid_samples": {}, "train_batches": {}, "valid_batches": {}}})",
                         std::chrono::system_clock::now(), json_str(name), train_samples, valid_samples, train_batches, valid_batches));
    if (mVerbosity >= 0) {
        printf("[Dataset]\n");
        printf(" %s: %ld train samples (%ld batches per worker), %ld validation samples (%ld batches)\n\n",
               std::string(name).c_str(), train_samples, train_batches, valid_samples, valid_batches);
    }
}

/**
 * @brief Log a training step (rank 0 only).
 *
 * Updates running totals used to compute the average training loss between evals.
 * Loss and accuracy are the values of this worker's batch only.
 *
 * @param epoch Current epoch.
 * @param step Step index within the epoch.
 * @param global_step Step coordinate used for scalar reports.
 * @param duration_ms Step duration in milliseconds.
 * @param loss Training loss for this step.
 * @param accuracy Top-1 accuracy of this step's batch, in [0, 1].
 * @param lr Learning rate for this step.
 */
void TrainingRunLogger::log_step(int epoch, int step, long global_step, int duration_ms, float loss, float accuracy, float lr)
{
    if(mRank != 0) return;
    mTotalTrainingLoss += loss;
    ++mTotalTrainingSteps;

    if(mVerbosity >= 0) {
        printf(":: epoch %3d step %5d | loss %6.4f | acc %5.1f%% | lr %.2e | %5d ms\n",
               epoch, step, loss, 100.f * accuracy, lr, duration_ms);
        fflush(stdout);
    }
    log_line(fmt::format(R"(  {{"log": "step", "time": "{}", "step": {}, "epoch": {}, "epoch_step": {}, "duration_ms": {}, "loss": {}, "accuracy": {}, "lr": {}}})",
        std::chrono::system_clock::now(), global_step, epoch, step, duration_ms, loss, accuracy, lr ));
}

/**
 * @brief Log the result of a validation pass (rank 0 only).
 *
 * Prints the gap to the mean training loss since the previous evaluation and resets it.
 */
void TrainingRunLogger::log_eval(int epoch, long global_step, int duration_ms, float loss, float accuracy)
{
    if(mRank != 0) return;
    if(mVerbosity >= -1) {
        float train_avg = static_cast<float>(mTotalTrainingLoss / std::max(mTotalTrainingSteps, 1));
        float gap = loss - train_avg;

        printf("\x1b[1m>> eval epoch %3d            loss %6.4f | gap %+7.4f | acc %5.1f%% | %5d ms\x1b[22m\n",
               epoch, loss, gap, 100.f * accuracy, duration_ms);
        fflush(stdout);
    }
    mTotalTrainingLoss = 0;
    mTotalTrainingSteps = 0;
    log_line(fmt::format(R"(  {{"log": "eval", "time": "{}", "step": {}, "epoch": {}, "duration_ms": {}, "loss": {}, "accuracy": {}}})",
        std::chrono::system_clock::now(), global_step, epoch, duration_ms, loss, accuracy ));
}

void TrainingRunLogger::log_scalar(std::string_view name, double value, long step)
{
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "scalar", "time": "{}", "step": {}, "name": {}, "value": {}}})",
        std::chrono::system_clock::now(), step, json_str(name), value));
    if(mVerbosity >= 1) {
        printf("[S] step %7ld | %-16s %g\n", step, std::string(name).c_str(), value);
    }
}

/**
 * @brief Log the command line used to start the run (rank 0 only).
 *
 * @param argc Argument count.
 * @param argv Argument vector; expected to be @p argc entries.
 */
void TrainingRunLogger::log_cmd(int argc, const char** argv)
{
    if(mRank != 0) return;
    std::string cmd = fmt::format(R"(  {{"log": "cmd", "time": "{}", "step": 0, "cmd": [)", std::chrono::system_clock::now());
    for (int i = 0; i < argc; i++)
    {
        if (i != 0) cmd += ", ";
        cmd += json_str(argv[i]);
    }
    cmd += "]}";
    log_line(cmd);
}

/**
 * @brief Append a JSON object line to the log array.
 *
 * Seeks back over the closing "\n]\n" so the file is a valid JSON array after every
 * write, then appends a separator (if needed), @p line, and a new closing bracket.
 *
 * @param line JSON object line to append.
 */
void TrainingRunLogger::log_line(std::string_view line) {
    if(mCallback)
        mCallback(line);

    if(!mLogFile.is_open()) return;

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

/**
 * @brief Set a callback invoked for each JSON log line before file append.
 *
 * @param cb Callback taking the JSON line as a string_view; may be empty/null.
 */
void TrainingRunLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

/**
 * @brief Log an informational message (rank 0 only).
 *
 * Prints to stdout (verbosity-dependent) and writes a JSON "info" record.
 */
void TrainingRunLogger::log_message(long step, const std::string& msg) {
    if(mRank != 0) return;
    if(mVerbosity >= 0) {
        fprintf(stdout, "%s\n", msg.c_str());
    }
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}}})",
                         std::chrono::system_clock::now(), step, json_str(msg) ));
}

/**
 * @brief Begin a timed logging section (rank 0 only).
 *
 * @param step Step associated with this section.
 * @param info Human-readable description printed to stdout and stored in JSON.
 * @return RAII_Section handle; on non-zero ranks, contains nullptr and is a no-op.
 */
TrainingRunLogger::RAII_Section TrainingRunLogger::log_section_start(long step, const std::string& info) {
    if(mRank != 0) return RAII_Section{nullptr};
    mSectionInfo = info;
    mSectionStep = step;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= 0) {
        printf("%s ...\n", info.data());
    }
    return RAII_Section{this};
}

/**
 * @brief End the current timed section and emit its duration (rank 0 only).
 */
void TrainingRunLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    if(mRank != 0) return;
    log_line(fmt::format(R"(  {{"log": "info", "time": "{}", "step": {}, "message": {}, "duration_ms": {}}})",
                         std::chrono::system_clock::now(), mSectionStep, json_str(mSectionInfo), milliseconds ));

    if(mVerbosity >= 0) {
        if(milliseconds < 2000) {
            printf("  done in %ld ms\n\n", milliseconds);
        } else {
            printf("  done in %ld s\n\n", milliseconds / 1000);
        }
    }
}
