// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_session.hpp>

#include <CLI/CLI.hpp>
#include <string>
#include <vector>

#include "test_config.h"

int main(int argc, char** argv) {
    testing_config::TestSimulationConfig cfg{};
    CLI::App app{"lockstep unit tests"};
    app.allow_extras();

    app.add_option("--world-size", cfg.WorldSize, "Number of simulated workers for the multi-worker tests");
    app.add_option("--sim-seed", cfg.Seed, "Seed for the generated test data");

    std::vector<std::string> remaining;
    try {
        app.parse(argc, argv);
        remaining = app.remaining();
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    testing_config::set_test_config(cfg);

    // Forward remaining args to Catch2
    std::vector<const char*> args;
    args.reserve(1 + remaining.size());
    args.push_back(argv[0]);
    for (const auto& s : remaining) {
        args.push_back(s.c_str());
    }

    return Catch::Session().run((int)args.size(), const_cast<char**>(args.data()));
}
