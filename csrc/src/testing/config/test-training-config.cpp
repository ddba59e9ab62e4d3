// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for run options and the derived training configuration

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <fstream>
#include <set>
#include <stdexcept>
#include <string>

#include "config/training_config.h"
#include "test_utils.h"

namespace {

std::string write_file(const testing_utils::TempDir& dir, const std::string& content) {
    const auto path = dir.path() / "options.json";
    std::ofstream out(path);
    out << content;
    return path.string();
}

} // anonymous namespace

TEST_CASE("base learning rate scales with the global batch", "[config]") {
    TrainingOptions options;
    options.BatchSize = 128;
    const TrainingConfig config = make_training_config(options, WorkerIdentity{.Rank = 0, .WorldSize = 8, .DeviceIndex = 0});

    CHECK(config.BaseLearningRate == Catch::Approx(0.0004 * 128 * 8));
    CHECK(config.BatchSize == 128);
    CHECK(config.EpochCount == 90);
    CHECK(config.Momentum == 0.9);
    CHECK(config.WeightDecay == 1e-4);
    CHECK(config.Dataset == "cifar10");
}

TEST_CASE("invalid options are rejected", "[config]") {
    TrainingOptions options;
    const WorkerIdentity identity{.Rank = 1, .WorldSize = 4, .DeviceIndex = 1};

    SECTION("batch size") {
        options.BatchSize = 0;
        CHECK_THROWS_AS(make_training_config(options, identity), std::invalid_argument);
    }
    SECTION("epochs") {
        options.Epochs = -1;
        CHECK_THROWS_AS(make_training_config(options, identity), std::invalid_argument);
    }
    SECTION("report interval") {
        options.ReportEvery = 0;
        CHECK_THROWS_AS(make_training_config(options, identity), std::invalid_argument);
    }
    SECTION("world size hint differs from the process group") {
        options.WorldSizeHint = 2;
        CHECK_THROWS_AS(make_training_config(options, identity), std::invalid_argument);
        options.WorldSizeHint = 4;
        CHECK_NOTHROW(make_training_config(options, identity));
    }
}

TEST_CASE("options file values apply unless given on the command line", "[config]") {
    testing_utils::TempDir dir;
    const std::string file = write_file(dir, R"({"batch": 64, "epochs": 3, "run": "baseline", "check-lockstep": true, "seed": 9})");

    TrainingOptions options;
    options.Epochs = 5;     // set on the command line
    const std::set<std::string> overridden = {"epochs"};
    apply_options_file(options, file, [&](std::string_view key) { return overridden.contains(std::string(key)); });

    CHECK(options.BatchSize == 64);
    CHECK(options.Epochs == 5);
    CHECK(options.RunName == "baseline");
    CHECK(options.CheckLockstep);
    CHECK(options.Seed == 9u);
}

TEST_CASE("malformed options files are rejected", "[config]") {
    testing_utils::TempDir dir;
    TrainingOptions options;
    auto nothing_overridden = [](std::string_view) { return false; };

    CHECK_THROWS_AS(apply_options_file(options, write_file(dir, R"({"batch-size": 64})"), nothing_overridden), std::runtime_error);
    CHECK_THROWS_AS(apply_options_file(options, write_file(dir, R"({"batch": "large"})"), nothing_overridden), std::runtime_error);
    CHECK_THROWS_AS(apply_options_file(options, write_file(dir, R"([1, 2])"), nothing_overridden), std::runtime_error);
    CHECK_THROWS_AS(apply_options_file(options, write_file(dir, "{"), nothing_overridden), std::runtime_error);
    CHECK_THROWS_AS(apply_options_file(options, (dir.path() / "missing.json").string(), nothing_overridden), std::runtime_error);
}

TEST_CASE("log file name expands the run name", "[config]") {
    TrainingOptions options;
    options.LogFile = "logs/%n.json";
    CHECK(resolve_log_file(options) == "logs/lockstep.json");
    options.RunName = "large-batch";
    CHECK(resolve_log_file(options) == "logs/large-batch.json");

    CHECK(default_log_file().starts_with("logs/%n-"));
}
