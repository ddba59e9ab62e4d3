// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for accuracy counting and the cross-worker metric reduction

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <stdexcept>
#include <vector>

#include "training/metrics.h"
#include "utilities/comm.h"
#include "test_utils.h"

using testing_utils::run_ranks;

TEST_CASE("count_correct picks the highest score", "[metrics]") {
    // 3 samples x 3 classes
    std::vector<float> scores = {
        0.1f, 0.7f, 0.2f,
        2.0f, -1.f, 0.5f,
        0.0f, 0.0f, 3.0f,
    };
    std::vector<int> labels = {1, 2, 2};
    CorrectTotal counts = count_correct(scores, labels, 3);
    CHECK(counts.Correct == 2);
    CHECK(counts.Total == 3);
    CHECK(accuracy(counts) == Catch::Approx(2.0 / 3.0));
}

TEST_CASE("count_correct resolves ties to the lowest class", "[metrics]") {
    std::vector<float> scores = {1.f, 1.f, 1.f, 1.f};
    CHECK(count_correct(scores, std::vector<int>{0}, 4).Correct == 1);
    CHECK(count_correct(scores, std::vector<int>{3}, 4).Correct == 0);
}

TEST_CASE("count_correct validates shapes", "[metrics]") {
    std::vector<float> scores(5);
    CHECK_THROWS_AS(count_correct(scores, std::vector<int>{0, 1}, 3), std::invalid_argument);
    CHECK_THROWS_AS(count_correct(scores, std::vector<int>{0}, 0), std::invalid_argument);
}

TEST_CASE("accuracy of zero samples is an error", "[metrics]") {
    CHECK_THROWS_AS(accuracy(CorrectTotal{}), MetricError);
}

TEST_CASE("world accuracy sums counts before dividing", "[metrics]") {
    // 8/10 and 9/10 give 17/20, not the mean of per-worker accuracies of different sizes
    auto results = run_ranks<double>(2, [](Communicator& comm) {
        MetricReducer reducer(comm);
        CorrectTotal local = comm.rank() == 0 ? CorrectTotal{8, 10} : CorrectTotal{9, 10};
        return reducer.world_accuracy(local);
    });
    CHECK(results[0] == Catch::Approx(0.85));
    CHECK(results[1] == Catch::Approx(0.85));

    auto uneven = run_ranks<double>(2, [](Communicator& comm) {
        MetricReducer reducer(comm);
        CorrectTotal local = comm.rank() == 0 ? CorrectTotal{1, 1} : CorrectTotal{0, 3};
        return reducer.world_accuracy(local);
    });
    CHECK(uneven[0] == Catch::Approx(0.25));
}

TEST_CASE("world accuracy without any samples throws on every worker", "[metrics]") {
    auto outcomes = run_ranks<int>(3, [](Communicator& comm) {
        MetricReducer reducer(comm);
        try {
            reducer.world_accuracy(CorrectTotal{});
        } catch (const MetricError&) {
            return 1;
        }
        return 0;
    });
    CHECK(outcomes == std::vector<int>{1, 1, 1});
}

TEST_CASE("local_average stays local", "[metrics]") {
    CHECK(MetricReducer::local_average({1.0, 2.0, 6.0}) == Catch::Approx(3.0));
    CHECK_THROWS_AS(MetricReducer::local_average({}), MetricError);
}
