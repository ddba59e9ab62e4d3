// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Tests for the SGD update and the replicated linear classifier

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <stdexcept>
#include <vector>

#include "training/classifier.h"
#include "training/data.h"
#include "utilities/comm.h"
#include "test_utils.h"

using testing_utils::run_ranks;

namespace {

Batch make_batch(std::vector<float> inputs, std::vector<int> labels, int features) {
    Batch batch;
    batch.Size = static_cast<int>(labels.size());
    batch.Features = features;
    batch.Inputs = std::move(inputs);
    batch.Labels = std::move(labels);
    return batch;
}

std::vector<float> to_vector(std::span<const float> values) {
    return {values.begin(), values.end()};
}

} // anonymous namespace

TEST_CASE("SGD with momentum and weight decay", "[classifier][sgd]") {
    SGDOptimizer sgd(0.1, 0.9, 0.01);
    std::vector<float> params = {1.f, -2.f};
    const std::vector<float> grads = {0.5f, 0.5f};

    sgd.step(params, grads);
    // first step: the momentum buffer is the decayed gradient itself
    CHECK(params[0] == Catch::Approx(1.f - 0.1f * 0.51f));
    CHECK(params[1] == Catch::Approx(-2.f - 0.1f * 0.48f));

    sgd.step(params, grads);
    const float d0 = 0.5f + 0.01f * 0.949f;
    CHECK(params[0] == Catch::Approx(0.949f - 0.1f * (0.9f * 0.51f + d0)));

    SECTION("learning rate changes apply to the next step") {
        sgd.set_learning_rate(0.0);
        const std::vector<float> before = params;
        sgd.step(params, grads);
        CHECK(params == before);
    }
}

TEST_CASE("SGD rejects invalid input", "[classifier][sgd]") {
    CHECK_THROWS_AS(SGDOptimizer(-0.1, 0.9, 0.0), std::invalid_argument);
    CHECK_THROWS_AS(SGDOptimizer(0.1, -0.9, 0.0), std::invalid_argument);

    SGDOptimizer sgd(0.1, 0.9, 0.0);
    std::vector<float> params(3);
    const std::vector<float> grads(2);
    CHECK_THROWS_AS(sgd.step(params, grads), std::invalid_argument);
}

TEST_CASE("replicas start from rank 0's parameters", "[classifier]") {
    auto params = run_ranks<std::vector<float>>(3, [](Communicator& comm) {
        // a different seed per rank; the broadcast must still align them
        LinearClassifier model(4, 3, comm, SGDOptimizer(0.1, 0.9, 1e-4), 100 + comm.rank());
        return to_vector(model.parameters());
    });

    REQUIRE(params[0].size() == 3 * (4 + 1));
    CHECK(params[1] == params[0]);
    CHECK(params[2] == params[0]);
    const float bound = 1.f / std::sqrt(4.f);
    for (float p : params[0]) {
        CHECK(std::abs(p) <= bound);
    }
}

TEST_CASE("replicas stay identical after training on different data", "[classifier]") {
    auto params = run_ranks<std::vector<float>>(2, [](Communicator& comm) {
        LinearClassifier model(2, 2, comm, SGDOptimizer(0.5, 0.9, 1e-4), 7);
        const float sign = comm.rank() == 0 ? 1.f : -1.f;
        for (int step = 0; step < 3; ++step) {
            Batch batch = make_batch({sign, 2.f * sign, -sign, 0.5f}, {comm.rank(), 1 - comm.rank()}, 2);
            model.forward(batch);
            model.cross_entropy();
            model.backward();
            model.step();
            model.zero_grad();
        }
        return to_vector(model.parameters());
    });

    CHECK(params[0] == params[1]);
}

TEST_CASE("gradients are the mean over all workers' samples", "[classifier]") {
    const std::vector<float> inputs = {1.f, 0.f, 0.f, 1.f, 2.f, -1.f, -0.5f, 0.5f};
    const std::vector<int> labels = {0, 1, 2, 1};

    // one worker on all four samples
    auto single = run_ranks<std::vector<float>>(1, [&](Communicator& comm) {
        LinearClassifier model(2, 3, comm, SGDOptimizer(0.1, 0.0, 0.0), 11);
        Batch batch = make_batch(inputs, labels, 2);
        model.forward(batch);
        model.cross_entropy();
        model.backward();
        return to_vector(model.gradients());
    });

    // two workers on two samples each
    auto split = run_ranks<std::vector<float>>(2, [&](Communicator& comm) {
        LinearClassifier model(2, 3, comm, SGDOptimizer(0.1, 0.0, 0.0), 11);
        const int first = 2 * comm.rank();
        Batch batch = make_batch({inputs.begin() + 2 * first, inputs.begin() + 2 * first + 4},
                                 {labels.begin() + first, labels.begin() + first + 2}, 2);
        model.forward(batch);
        model.cross_entropy();
        model.backward();
        return to_vector(model.gradients());
    });

    REQUIRE(single[0].size() == split[0].size());
    CHECK(split[0] == split[1]);
    for (std::size_t i = 0; i < single[0].size(); ++i) {
        CHECK(split[0][i] == Catch::Approx(single[0][i]).margin(1e-6));
    }
}

TEST_CASE("cross entropy of a known batch", "[classifier]") {
    auto results = run_ranks<std::vector<double>>(1, [](Communicator& comm) {
        LinearClassifier model(1, 4, comm, SGDOptimizer(0.1, 0.0, 0.0), 3);
        // zero input: the scores are the bias values only
        Batch batch = make_batch({0.f, 0.f}, {1, 3}, 1);
        auto scores = model.forward(batch);
        const double loss = model.cross_entropy();

        double expected = 0.0;
        for (int i = 0; i < 2; ++i) {
            double sum = 0.0;
            for (int c = 0; c < 4; ++c) {
                sum += std::exp(static_cast<double>(scores[i * 4 + c]));
            }
            expected += std::log(sum) - scores[i * 4 + batch.Labels[i]];
        }
        return std::vector<double>{loss, expected / 2};
    });

    CHECK(results[0][0] == Catch::Approx(results[0][1]));
    CHECK(results[0][0] > 0.0);
}

TEST_CASE("classifier calls out of order are rejected", "[classifier]") {
    auto outcomes = run_ranks<std::vector<int>>(1, [](Communicator& comm) {
        LinearClassifier model(2, 2, comm, SGDOptimizer(0.1, 0.0, 0.0), 0);
        std::vector<int> thrown;
        auto expect = [&](auto&& fn) {
            try {
                fn();
                thrown.push_back(0);
            } catch (const std::logic_error&) {
                thrown.push_back(1);
            }
        };
        expect([&] { model.cross_entropy(); });
        expect([&] { model.backward(); });

        Batch wrong_shape = make_batch({1.f, 2.f, 3.f}, {0}, 3);
        expect([&] { model.forward(wrong_shape); });
        return thrown;
    });

    // invalid_argument derives from logic_error
    CHECK(outcomes[0] == std::vector<int>{1, 1, 1});
}
