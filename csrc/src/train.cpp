// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "utilities/comm.h"
#include "utilities/cuda_check.h"
#include "utilities/gpu_info.h"

#include "config/training_config.h"
#include "training/bootstrap.h"
#include "training/classifier.h"
#include "training/data.h"
#include "training/logging.h"
#include "training/reporter.h"
#include "training/schedule.h"
#include "training/trainer.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <CLI/CLI.hpp>
#include <fmt/core.h>

struct TrainingRunner {
    TrainingOptions Options;
    /// Optional JSON options file; flags given on the command line take precedence.
    std::string ConfigFile;

    std::chrono::steady_clock::time_point BeginStartup = std::chrono::steady_clock::now();

    void load_training_config(int argc, const char** argv);
    void launch_training(int argc, const char** argv);
    void run_training(int argc, const char** argv, Communicator& comm, const DatasetSplits& data);
};

void TrainingRunner::load_training_config(int argc, const char** argv) {
    CLI::App app{"Data-parallel image classifier training", "lockstep-train"};

    app.add_option("-d,--data", Options.Dataset, "Dataset to train on")->check(CLI::IsMember(known_datasets()));
    app.add_option("--data-dir", Options.DataDir, "Directory containing the extracted dataset archives");
    app.add_option("-b,--batch", Options.BatchSize, "Mini-batch size per worker")->check(CLI::PositiveNumber);
    app.add_option("-e,--epochs", Options.Epochs, "Number of training epochs")->check(CLI::PositiveNumber);
    app.add_option("--run", Options.RunName, "Name of this run. Scalar events are written below --run-dir only for named runs. You can use %n as part of the log file name.");
    app.add_option("--run-dir", Options.RunDir, "Parent directory of the scalar event directories");
    app.add_option("--log-file,--log-filename", Options.LogFile, "Where to save the training log; empty to disable");
    app.add_flag("--debug", Options.Debug, "Verbose console output");
    app.add_option("--local_rank", Options.LocalRank, "Local rank passed by legacy launchers; overrides LOCAL_RANK");
    app.add_option("--from-rank", Options.FromRank, "Device index offset of this machine")->check(CLI::NonNegativeNumber);
    app.add_option("--gpus", Options.GPUs, "How many GPUs to use when no launcher is present (0 = all)")->check(CLI::NonNegativeNumber);
    app.add_option("--world-size", Options.WorldSizeHint, "Expected number of workers (0 = any)")->check(CLI::NonNegativeNumber);
    app.add_option("--report-every", Options.ReportEvery, "Report per-step scalars every n steps")->check(CLI::PositiveNumber);
    app.add_option("--seed", Options.Seed, "Seed for data shuffling and parameter initialization");
    app.add_flag("--check-lockstep", Options.CheckLockstep, "Verify before every collective that all workers are at the same position");
    app.add_option("--num-workers", Options.NumWorkers, "Data loading workers")->check(CLI::NonNegativeNumber);
    app.add_option("--config", ConfigFile, "JSON file with options; command line flags take precedence")->check(CLI::ExistingFile);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!ConfigFile.empty()) {
        apply_options_file(Options, ConfigFile, [&app](std::string_view key) {
            return app.get_option("--" + std::string(key))->count() > 0;
        });
    }

    Options.LogFile = resolve_log_file(Options);
}

void TrainingRunner::launch_training(int argc, const char** argv) {
    auto env = read_launch_environment(process_environment(), Options.LocalRank, Options.FromRank);

    // all workers of this process share the read-only datasets
    const DatasetSplits data = load_cifar(Options.DataDir, Options.Dataset);

    if (env.has_value()) {
        // launcher code path -- this region is entered by all processes, so no additional
        // launching necessary
        bind_device(env->Identity.DeviceIndex);
        auto comm = Communicator::make_process_group(*env, Options.CheckLockstep);
        run_training(argc, argv, *comm, data);
    } else {
        // Threads code path -- launch one thread per GPU
        Communicator::run_nccl_communicators(
            Options.GPUs, Options.FromRank, Options.CheckLockstep,
            [&](Communicator& comm) { run_training(argc, argv, comm, data); });
    }
}

void TrainingRunner::run_training(int argc, const char** argv, Communicator& comm, const DatasetSplits& data) {
    const WorkerIdentity identity = comm.identity();
    const TrainingConfig config = make_training_config(Options, identity);

    TrainingRunLogger logger(Options.LogFile, identity.Rank,
                             Options.Debug ? TrainingRunLogger::VERBOSE : TrainingRunLogger::DEFAULT);
    logger.log_cmd(argc, argv);
    logger.log_options({
        {"data",               Options.Dataset},
        {"data-dir",           Options.DataDir},
        {"batch",              static_cast<std::int64_t>(config.BatchSize)},
        {"epochs",             static_cast<std::int64_t>(config.EpochCount)},
        {"world-size",         static_cast<std::int64_t>(identity.WorldSize)},
        {"base-learning-rate", static_cast<float>(config.BaseLearningRate)},
        {"momentum",           static_cast<float>(config.Momentum)},
        {"weight-decay",       static_cast<float>(config.WeightDecay)},
        {"report-every",       static_cast<std::int64_t>(config.ReportEvery)},
        {"seed",               static_cast<std::int64_t>(config.Seed)},
        {"check-lockstep",     config.CheckLockstep},
        {"num-workers",        static_cast<std::int64_t>(Options.NumWorkers)},
        {"from-rank",          static_cast<std::int64_t>(Options.FromRank)},
        {"run",                Options.RunName},
        {"run-dir",            Options.RunDir},
        {"log-file",           Options.LogFile},
    });
    logger.log_devices(gather_device_info(comm));

    DataLoader train_loader(*data.Train, config.BatchSize, true,
                            DistributedSampler(data.Train->size(), identity.Rank, identity.WorldSize, true, config.Seed));
    DataLoader valid_loader(*data.Valid, config.BatchSize, false);
    logger.log_dataset(config.Dataset, static_cast<long>(data.Train->size()), static_cast<long>(data.Valid->size()),
                       static_cast<long>(train_loader.num_batches()), static_cast<long>(valid_loader.num_batches()));

    std::unique_ptr<LinearClassifier> model;
    {
        auto log = logger.log_section_start(0, "Initializing model");
        model = std::make_unique<LinearClassifier>(
            data.Train->num_features(), data.Train->num_classes(), comm,
            SGDOptimizer(config.BaseLearningRate, config.Momentum, config.WeightDecay), config.Seed);
    }
    WarmupMultiStepSchedule schedule(identity.WorldSize);

    // only invoked on rank 0
    auto reporter = make_reporter(identity, [&]() -> std::unique_ptr<IMetricsSink> {
        std::vector<std::unique_ptr<IMetricsSink>> sinks;
        sinks.push_back(std::make_unique<LoggerSink>(logger));
        if (!Options.RunName.empty()) {
            auto directory = std::filesystem::path(Options.RunDir) / format_run_name(Options.RunName, std::chrono::system_clock::now());
            auto writer = std::make_unique<ScalarEventWriter>(directory);
            logger.log_message(0, fmt::format("Writing scalar events to `{}`", writer->path().string()));
            sinks.push_back(std::move(writer));
        }
        return std::make_unique<TeeSink>(std::move(sinks));
    });

    TrainingLoop loop(config, identity, comm, train_loader, valid_loader, *model, schedule, *reporter, logger);

    logger.log_message(0, fmt::format("Starting training for {} epochs ({} steps per epoch, base learning rate {:g})",
                                      config.EpochCount, train_loader.num_batches(), config.BaseLearningRate));
    logger.log_message(0, fmt::format("Setup took {} seconds",
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - BeginStartup).count()));

    std::vector<EpochSummary> summaries;
    {
        NvtxRange range("train");
        summaries = loop.run();
    }

    const EpochSummary& last = summaries.back();
    logger.log_message(loop.state().GlobalStep, fmt::format("Done. validation loss {:.4f}, accuracy {:.2f}% ({} / {})",
                                                            last.ValidLoss, 100.0 * last.ValidAccuracy,
                                                            last.ValidCorrect, last.ValidTotal));
}

/**
 * @brief Program entry point. Creates a TrainingRunner, parses CLI args, and launches training.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return 0 on success; nonzero on failure (errors are printed to stderr).
 */
int main(int argc, const char** argv) {
    try {
        TrainingRunner runner;
        runner.load_training_config(argc, argv);
        runner.launch_training(argc, argv);
        return 0;
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_FAILURE;
    }
}
