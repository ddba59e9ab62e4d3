// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef LOCKSTEP_SRC_TRAINING_LOGGING_H
#define LOCKSTEP_SRC_TRAINING_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct DeviceInfo;

/**
 * @brief Run log of a training job.
 *
 * Only rank 0 produces output: a JSON array of log records in @p file_name (skipped if
 * the name is empty) and human-readable progress lines on stdout, filtered by verbosity.
 * On every other rank all methods are no-ops, so callers do not need to gate on rank.
 */
class TrainingRunLogger
{
public:
    enum EVerbosity {
        SILENT = -2,
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    using OptionValue = std::variant<bool, std::int64_t, float, std::string>;

    TrainingRunLogger(const std::string& file_name, int rank, EVerbosity verbosity);
    ~TrainingRunLogger();

    void set_callback(std::function<void(std::string_view)> cb);

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, OptionValue>>& options);
    void log_devices(const std::vector<DeviceInfo>& devices);
    void log_dataset(std::string_view name, long train_samples, long valid_samples, long train_batches, long valid_batches);
    void log_step(int epoch, int step, long global_step, int duration_ms, float loss, float accuracy, float lr);
    void log_eval(int epoch, long global_step, int duration_ms, float loss, float accuracy);
    void log_scalar(std::string_view name, double value, long step);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
    private:
        RAII_Section(TrainingRunLogger* l) : mLogger(l) {}
        RAII_Section(RAII_Section&&) = default;
        TrainingRunLogger* mLogger;

        friend class TrainingRunLogger;
    };

    void log_message(long step, const std::string& msg);
    RAII_Section log_section_start(long step, const std::string& info);
    void log_section_end();

    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }
    [[nodiscard]] const std::string& file_name() const { return mFileName; }

private:
    void log_line(std::string_view line);
    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;

    int mRank;
    EVerbosity mVerbosity;

    // running mean for training loss between evaluations
    double mTotalTrainingLoss = 0.0;
    int mTotalTrainingSteps = 0;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we safe intermediaries
    std::string mSectionInfo;
    long mSectionStep = 0;
    std::chrono::steady_clock::time_point mSectionStart;
};

#endif //LOCKSTEP_SRC_TRAINING_LOGGING_H
