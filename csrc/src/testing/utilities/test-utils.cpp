// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>

#include "utilities/utils.h"

TEST_CASE("div_ceil rounds up", "[utils]") {
    CHECK(div_ceil(5, 2) == 3);
    CHECK(div_ceil(4, 2) == 2);
    CHECK(div_ceil<std::size_t>(0, 3) == 0);
}

TEST_CASE("narrow checks the target range", "[utils]") {
    CHECK(narrow<int>(std::int64_t{42}) == 42);
    CHECK_THROWS_AS(narrow<int>(std::int64_t{1} << 40), std::out_of_range);
    CHECK_THROWS_AS(narrow<unsigned>(-1), std::out_of_range);
}

TEST_CASE("replace_all expands every occurrence", "[utils]") {
    CHECK(replace_all("logs/%n-%n.json", "%n", "run") == "logs/run-run.json");
    CHECK(replace_all("plain", "%n", "run") == "plain");
    CHECK(replace_all("%n", "%n", "") == "");
}
