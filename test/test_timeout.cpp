/**
 * @file test_timeout.cpp
 * @brief Unit tests for read timeout translation
 * @version 1.0
 * @date 2025-10-14
 */

#include <catch2/catch_test_macros.hpp>
#include <chrono>

#include "../include/io/timeout.hpp"

using namespace serialio;
using namespace std::chrono_literals;

// Both conversions are usable at compile time
static_assert(to_posix_timeout(0ms).min_bytes == 1, "zero timeout waits for a byte");
static_assert(to_windows_timeout(250ms).constant == 250, "millisecond pass-through");

TEST_CASE("to_posix_timeout - No timeout", "[timeout][posix]") {
    SECTION("Zero waits for at least one byte") {
        auto t = to_posix_timeout(0ms);
        REQUIRE(t.min_bytes == 1);
        REQUIRE(t.deciseconds == 0);
    }

    SECTION("Negative is treated as no timeout") {
        auto t = to_posix_timeout(-5s);
        REQUIRE(t.min_bytes == 1);
        REQUIRE(t.deciseconds == 0);
    }
}

TEST_CASE("to_posix_timeout - Positive timeouts", "[timeout][posix]") {
    SECTION("250 ms truncates to 2 deciseconds") {
        auto t = to_posix_timeout(250ms);
        REQUIRE(t.min_bytes == 0);
        REQUIRE(t.deciseconds == 2);
    }

    SECTION("Exactly 100 ms is 1 decisecond") {
        REQUIRE(to_posix_timeout(100ms).deciseconds == 1);
    }

    SECTION("Below 100 ms still arms the shortest timer") {
        REQUIRE(to_posix_timeout(50ms).min_bytes == 0);
        REQUIRE(to_posix_timeout(50ms).deciseconds == 1);
        REQUIRE(to_posix_timeout(1us).deciseconds == 1);
    }

    SECTION("25.5 s is the largest representable value") {
        REQUIRE(to_posix_timeout(25500ms).deciseconds == MAX_VTIME);
    }

    SECTION("Longer timeouts are clamped") {
        REQUIRE(to_posix_timeout(30s).deciseconds == MAX_VTIME);
        REQUIRE(to_posix_timeout(std::chrono::hours(24)).deciseconds == MAX_VTIME);
    }

    SECTION("Every positive timeout yields VTIME in [1, 255] with VMIN 0") {
        for (long ms = 1; ms <= 30000; ms += 37) {
            auto t = to_posix_timeout(std::chrono::milliseconds(ms));
            REQUIRE(t.min_bytes == 0);
            REQUIRE(t.deciseconds >= 1);
            REQUIRE(t.deciseconds <= MAX_VTIME);
        }
    }
}

TEST_CASE("to_windows_timeout - No timeout", "[timeout][windows]") {
    auto t = to_windows_timeout(0ms);
    REQUIRE(t.interval == MAX_COMM_TIMEOUT);
    REQUIRE(t.multiplier == MAX_COMM_TIMEOUT);
    REQUIRE(t.constant == MAX_COMM_TIMEOUT - 1);

    auto negative = to_windows_timeout(-1ms);
    REQUIRE(negative.interval == MAX_COMM_TIMEOUT);
    REQUIRE(negative.constant == MAX_COMM_TIMEOUT - 1);
}

TEST_CASE("to_windows_timeout - Positive timeouts", "[timeout][windows]") {
    SECTION("Fixed total timeout in milliseconds") {
        auto t = to_windows_timeout(1500ms);
        REQUIRE(t.interval == 0);
        REQUIRE(t.multiplier == 0);
        REQUIRE(t.constant == 1500);
    }

    SECTION("Sub-millisecond timeouts round up to 1 ms") {
        REQUIRE(to_windows_timeout(300us).constant == 1);
    }

    SECTION("Huge timeouts clamp to MAXDWORD") {
        REQUIRE(to_windows_timeout(std::chrono::hours(24 * 365)).constant == MAX_COMM_TIMEOUT);
    }
}
