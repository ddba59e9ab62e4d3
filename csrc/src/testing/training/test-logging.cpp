// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the JSON run log

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "training/logging.h"
#include "test_utils.h"

namespace {

nlohmann::json read_log(const std::filesystem::path& file) {
    std::ifstream in(file);
    REQUIRE(in.is_open());
    return nlohmann::json::parse(in);
}

} // anonymous namespace

TEST_CASE("rank 0 writes a valid JSON array after every record", "[logging]") {
    testing_utils::TempDir dir;
    const auto file = dir.path() / "logs" / "run.json";

    TrainingRunLogger logger(file.string(), 0, TrainingRunLogger::SILENT);
    CHECK(std::filesystem::exists(file));
    CHECK(read_log(file).empty());

    const char* argv[] = {"lockstep-train", "--data", "cifar10"};
    logger.log_cmd(3, argv);
    logger.log_options({{"batch", std::int64_t{128}}, {"check-lockstep", true},
                        {"momentum", 0.5f}, {"data", std::string("cifar10")}});
    logger.log_dataset("cifar10", 50000, 10000, 195, 79);
    CHECK(read_log(file).size() == 6);

    logger.log_step(0, 0, 0, 12, 2.5f, 0.25f, 0.5f);
    logger.log_eval(0, 195, 40, 1.75f, 0.5f);
    logger.log_scalar("accuracy/valid", 0.5, 195);
    logger.log_message(195, "message with \"quotes\"");
    {
        auto section = logger.log_section_start(195, "Saving");
    }

    const nlohmann::json log = read_log(file);
    REQUIRE(log.is_array());
    REQUIRE(log.size() == 11);

    CHECK(log[0]["log"] == "cmd");
    CHECK(log[0]["cmd"] == nlohmann::json::array({"lockstep-train", "--data", "cifar10"}));

    CHECK(log[1]["log"] == "option");
    CHECK(log[1]["name"] == "batch");
    CHECK(log[1]["value"] == 128);
    CHECK(log[2]["value"] == true);
    CHECK(log[3]["value"].get<double>() == 0.5);
    CHECK(log[4]["value"] == "cifar10");

    CHECK(log[5]["log"] == "dataset");
    CHECK(log[5]["train_batches"] == 195);

    CHECK(log[6]["log"] == "step");
    CHECK(log[6]["loss"].get<double>() == 2.5);
    CHECK(log[6]["accuracy"].get<double>() == 0.25);

    CHECK(log[7]["log"] == "eval");
    CHECK(log[7]["step"] == 195);

    CHECK(log[8]["log"] == "scalar");
    CHECK(log[8]["name"] == "accuracy/valid");

    CHECK(log[9]["message"] == "message with \"quotes\"");
    CHECK(log[10]["message"] == "Saving");
    CHECK(log[10].contains("duration_ms"));
}

TEST_CASE("other ranks write nothing", "[logging]") {
    testing_utils::TempDir dir;
    const auto file = dir.path() / "run.json";

    std::vector<std::string> lines;
    TrainingRunLogger logger(file.string(), 1, TrainingRunLogger::DEFAULT);
    logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });
    logger.log_step(0, 0, 0, 1, 1.f, 1.f, 1.f);
    logger.log_message(0, "hidden");
    {
        auto section = logger.log_section_start(0, "hidden");
    }

    CHECK_FALSE(std::filesystem::exists(file));
    CHECK(lines.empty());
}

TEST_CASE("an empty file name disables the log file", "[logging]") {
    std::vector<std::string> lines;
    TrainingRunLogger logger("", 0, TrainingRunLogger::SILENT);
    logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });
    logger.log_scalar("lr", 0.1, 0);

    REQUIRE(lines.size() == 1);
    CHECK(nlohmann::json::parse(lines[0])["name"] == "lr");
}
