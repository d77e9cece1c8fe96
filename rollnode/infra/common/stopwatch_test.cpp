// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <thread>

#include <catch2/catch_test_macros.hpp>

namespace rollnode {

using namespace std::chrono_literals;

TEST_CASE("Stop watch", "[rollnode][infra][common][stopwatch]") {
    StopWatch sw;
    CHECK(!sw);
    CHECK(sw.since_start() == StopWatch::Duration{0});
    CHECK(sw.lap() == std::pair<StopWatch::TimePoint, StopWatch::Duration>{});

    const auto started{sw.start()};
    CHECK(sw);
    CHECK(sw.start() == started);

    std::this_thread::sleep_for(2ms);
    const auto [lap_time, lap_duration] = sw.lap();
    CHECK(lap_time > started);
    CHECK(lap_duration >= 2ms);
    CHECK(sw.since_start() >= lap_duration);
}

TEST_CASE("Stop watch formatting", "[rollnode][infra][common][stopwatch]") {
    CHECK(StopWatch::format(750us) == "750us");
    CHECK(StopWatch::format(12ms + 5us) == "12.005ms");
    CHECK(StopWatch::format(3s + 40ms) == "3.040s");
    CHECK(StopWatch::format(2min + 5s) == "2m 5s");
}

}  // namespace rollnode
