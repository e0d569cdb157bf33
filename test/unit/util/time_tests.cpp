// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/time.hpp"

using namespace cartograph::util;

TEST_CASE("Time: mock time controls both clocks", "[util][time]") {
    SECTION("GetTime returns mock value") {
        MockTimeScope scope(1700000000);
        REQUIRE(GetTime() == 1700000000);
        SetMockTime(1700000042);
        REQUIRE(GetTime() == 1700000042);
    }

    SECTION("Steady clock advances with mock time") {
        MockTimeScope scope(1000);
        auto start = GetSteadyTime();
        SetMockTime(1030);
        auto later = GetSteadyTime();
        REQUIRE(std::chrono::duration_cast<std::chrono::seconds>(later - start).count() == 30);
    }

    SECTION("Scope restores real time") {
        {
            MockTimeScope scope(42);
            REQUIRE(GetTime() == 42);
        }
        REQUIRE(GetTime() > 1600000000);
    }
}

TEST_CASE("Time: FormatIsoTime", "[util][time]") {
    REQUIRE(FormatIsoTime(0) == "1970-01-01T00:00:00Z");
    REQUIRE(FormatIsoTime(1700000000) == "2023-11-14T22:13:20Z");
}
