// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for mock time

#include <catch2/catch_test_macros.hpp>

#include "util/time.hpp"

using namespace skiff::util;

TEST_CASE("MockTimeScope: sets and restores mock time", "[time]") {
    REQUIRE(GetMockTime() == 0);
    {
        MockTimeScope outer(5000);
        REQUIRE(GetMockTime() == 5000);
        {
            MockTimeScope inner(7000);
            REQUIRE(GetMockTime() == 7000);
        }
        REQUIRE(GetMockTime() == 5000);
    }
    REQUIRE(GetMockTime() == 0);
}

TEST_CASE("GetSteadyTime: follows mock time", "[time]") {
    MockTimeScope mock_time(1000);
    auto start = GetSteadyTime();

    SetMockTime(1060);
    auto later = GetSteadyTime();
    REQUIRE(later - start == std::chrono::seconds(60));

    SetMockTime(1030);
    REQUIRE(GetSteadyTime() - start == std::chrono::seconds(30));
}

TEST_CASE("GetSteadyTime: real clock without mock", "[time]") {
    REQUIRE(GetMockTime() == 0);
    auto a = GetSteadyTime();
    auto b = GetSteadyTime();
    REQUIRE(b >= a);
}
