/**
 * @file test_adaptive_concurrency.cpp
 * @brief Unit tests for latency-driven worker count adjustment
 */

#include <catch2/catch.hpp>
#include "core/adaptive_concurrency.h"

static AdaptiveConcurrency::Options small_window(int max_workers = 50) {
    AdaptiveConcurrency::Options opts;
    opts.window = 5;
    opts.max_workers = max_workers;
    return opts;
}

TEST_CASE("Grow and shrink policies", "[adaptive]") {
    REQUIRE(AdaptiveConcurrency::grow(10, 50) == 12);
    REQUIRE(AdaptiveConcurrency::grow(2, 50) == 3);
    REQUIRE(AdaptiveConcurrency::grow(48, 50) == 50);
    REQUIRE(AdaptiveConcurrency::grow(50, 50) == 50);

    REQUIRE(AdaptiveConcurrency::shrink(10) == 7);
    REQUIRE(AdaptiveConcurrency::shrink(2) == 1);
    REQUIRE(AdaptiveConcurrency::shrink(1) == 1);
}

TEST_CASE("Decisions happen once per full window", "[adaptive]") {
    AdaptiveConcurrency ac(10, small_window());

    for (int i = 0; i < 4; i++) {
        REQUIRE_FALSE(ac.record(20.0).has_value());
    }
    REQUIRE(ac.workers() == 10);

    auto changed = ac.record(20.0);
    REQUIRE(changed.has_value());
    REQUIRE(*changed == 12);
    REQUIRE(ac.workers() == 12);
    REQUIRE(ac.adjustments() == 1);
    REQUIRE(ac.last_median() == Approx(20.0));
}

TEST_CASE("Slow targets shrink the pool", "[adaptive]") {
    AdaptiveConcurrency ac(10, small_window());
    for (int i = 0; i < 5; i++) ac.record(800.0);
    REQUIRE(ac.workers() == 7);

    for (int i = 0; i < 5; i++) ac.record(800.0);
    REQUIRE(ac.workers() == 4);
}

TEST_CASE("Latencies between thresholds keep the pool size", "[adaptive]") {
    AdaptiveConcurrency ac(10, small_window());
    for (int i = 0; i < 10; i++) REQUIRE_FALSE(ac.record(250.0).has_value());
    REQUIRE(ac.workers() == 10);
    REQUIRE(ac.adjustments() == 0);
}

TEST_CASE("Median ignores isolated outliers", "[adaptive]") {
    AdaptiveConcurrency ac(10, small_window());
    for (double ms : {30.0, 40.0, 5000.0, 50.0, 6000.0}) ac.record(ms);
    REQUIRE(ac.last_median() == Approx(50.0));
    REQUIRE(ac.workers() == 12);
}

TEST_CASE("Worker count stays within bounds", "[adaptive]") {
    SECTION("Never below one") {
        AdaptiveConcurrency ac(1, small_window());
        for (int i = 0; i < 20; i++) ac.record(2000.0);
        REQUIRE(ac.workers() == 1);
    }

    SECTION("Never above the ceiling") {
        AdaptiveConcurrency ac(10, small_window(15));
        for (int i = 0; i < 50; i++) ac.record(1.0);
        REQUIRE(ac.workers() == 15);
    }

    SECTION("Initial count is clamped") {
        AdaptiveConcurrency ac(100, small_window(20));
        REQUIRE(ac.workers() == 20);
        AdaptiveConcurrency low(0, small_window());
        REQUIRE(low.workers() == 1);
    }
}
