// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the host-memory communicator used to simulate process groups

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <array>
#include <stdexcept>
#include <string>
#include <vector>

#include "utilities/comm.h"
#include "test_config.h"
#include "test_utils.h"

using testing_utils::run_ranks;

TEST_CASE("host communicator assigns ranks", "[comm][host]") {
    const int world = testing_config::get_test_config().WorldSize;
    auto identities = run_ranks<WorkerIdentity>(world, [](Communicator& comm) { return comm.identity(); });

    REQUIRE(identities.size() == static_cast<std::size_t>(world));
    for (int r = 0; r < world; ++r) {
        CHECK(identities[r].Rank == r);
        CHECK(identities[r].WorldSize == world);
    }
}

TEST_CASE("host communicator all_reduce_sum on counts", "[comm][host]") {
    const int world = testing_config::get_test_config().WorldSize;
    auto sums = run_ranks<std::vector<std::int64_t>>(world, [](Communicator& comm) {
        std::vector<std::int64_t> values = {comm.rank() + 1, 10};
        comm.all_reduce_sum(values.data(), 2);
        return values;
    });

    const std::int64_t expected_first = static_cast<std::int64_t>(world) * (world + 1) / 2;
    for (const auto& values : sums) {
        CHECK(values[0] == expected_first);
        CHECK(values[1] == 10 * world);
    }
}

TEST_CASE("host communicator all_reduce_avg is identical on every rank", "[comm][host]") {
    auto results = run_ranks<std::vector<float>>(4, [](Communicator& comm) {
        std::vector<float> grads = {static_cast<float>(comm.rank()), 1.f, -2.f * comm.rank()};
        comm.all_reduce_avg(grads.data(), grads.size());
        return grads;
    });

    for (const auto& grads : results) {
        CHECK(grads[0] == Catch::Approx(1.5f));
        CHECK(grads[1] == Catch::Approx(1.f));
        CHECK(grads[2] == Catch::Approx(-3.f));
        CHECK(grads == results.front());
    }
}

TEST_CASE("host communicator broadcast copies the root buffer", "[comm][host]") {
    auto results = run_ranks<std::vector<float>>(3, [](Communicator& comm) {
        std::vector<float> params(4, static_cast<float>(comm.rank() + 7));
        comm.broadcast(params.data(), params.size(), 1);
        return params;
    });

    for (const auto& params : results) {
        CHECK(params == std::vector<float>(4, 8.f));
    }
}

TEST_CASE("host_gather collects on rank 0 only", "[comm][host]") {
    auto results = run_ranks<std::vector<int>>(3, [](Communicator& comm) {
        return comm.host_gather(comm.rank() * 100);
    });

    CHECK(results[0] == std::vector<int>{0, 100, 200});
    CHECK(results[1].empty());
    CHECK(results[2].empty());
}

TEST_CASE("lockstep check passes when all ranks agree", "[comm][lockstep]") {
    auto checks = run_ranks<int>(2, [](Communicator& comm) {
        comm.check_lockstep(LockstepTag{.Epoch = 3, .Step = 7, .Op = ECollective::GradientSync});
        comm.check_lockstep(LockstepTag{.Epoch = 3, .Step = 0, .Op = ECollective::MetricReduce});
        return comm.lockstep_checks() ? 1 : 0;
    });
    CHECK(checks == std::vector<int>{1, 1});
}

TEST_CASE("lockstep check throws on every rank when workers diverge", "[comm][lockstep]") {
    auto outcomes = run_ranks<std::string>(2, [](Communicator& comm) -> std::string {
        // rank 1 skipped a training step and is already at the validation reduction
        LockstepTag tag = comm.rank() == 0
            ? LockstepTag{.Epoch = 0, .Step = 4, .Op = ECollective::GradientSync}
            : LockstepTag{.Epoch = 0, .Step = 0, .Op = ECollective::MetricReduce};
        try {
            comm.check_lockstep(tag);
        } catch (const LockstepError& e) {
            return e.what();
        }
        return "";
    });

    for (const auto& message : outcomes) {
        CHECK(message.find("gradient-sync") != std::string::npos);
        CHECK(message.find("metric-reduce") != std::string::npos);
    }
}

TEST_CASE("run_host_communicators rethrows a worker exception", "[comm][host]") {
    CHECK_THROWS_AS(Communicator::run_host_communicators(2, [](Communicator& comm) {
        comm.barrier();
        throw std::runtime_error("worker failed");
    }), std::runtime_error);
}

TEST_CASE("a failing rank does not block the remaining ranks", "[comm][host]") {
    CHECK_THROWS_AS(Communicator::run_host_communicators(2, [](Communicator& comm) {
        if (comm.rank() == 0) {
            throw std::runtime_error("rank 0 failed during setup");
        }
        comm.barrier();
    }), std::runtime_error);
}

TEST_CASE("run_host_communicators rejects an empty group", "[comm][host]") {
    CHECK_THROWS_AS(Communicator::run_host_communicators(0, [](Communicator&) {}), std::invalid_argument);
}

TEST_CASE("collective names", "[comm]") {
    CHECK(std::string(collective_name(ECollective::Barrier)) == "barrier");
    CHECK(std::string(collective_name(ECollective::ParameterBroadcast)) == "parameter-broadcast");
    CHECK(std::string(collective_name(ECollective::GradientSync)) == "gradient-sync");
    CHECK(std::string(collective_name(ECollective::MetricReduce)) == "metric-reduce");
}
