// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stopwatch.hpp"

#include <iomanip>
#include <sstream>

namespace rollnode {

using namespace std::chrono_literals;

StopWatch::TimePoint StopWatch::start() noexcept {
    if (started_) {
        return start_time_;
    }
    started_ = true;
    start_time_ = std::chrono::steady_clock::now();
    laps_.emplace_back(start_time_, Duration{0});
    return start_time_;
}

std::pair<StopWatch::TimePoint, StopWatch::Duration> StopWatch::lap() noexcept {
    if (!started_ || laps_.empty()) {
        return {};
    }
    const auto lap_time{std::chrono::steady_clock::now()};
    const auto previous{laps_.back().first};
    laps_.emplace_back(lap_time, std::chrono::duration_cast<Duration>(lap_time - previous));
    return laps_.back();
}

StopWatch::Duration StopWatch::since_start() const noexcept {
    if (!started_) {
        return {};
    }
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start_time_);
}

std::string StopWatch::format(Duration duration) noexcept {
    std::ostringstream os;
    const char fill = os.fill('0');
    if (duration >= 60s) {
        const auto m = std::chrono::duration_cast<std::chrono::minutes>(duration);
        duration -= m;
        os << m.count() << "m " << std::chrono::duration_cast<std::chrono::seconds>(duration).count() << "s";
    } else if (duration >= 1s) {
        const auto s = std::chrono::duration_cast<std::chrono::seconds>(duration);
        duration -= s;
        os << s.count() << "." << std::setw(3) << std::chrono::duration_cast<std::chrono::milliseconds>(duration).count()
           << "s";
    } else if (duration >= 1ms) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
        duration -= ms;
        os << ms.count() << "." << std::setw(3) << std::chrono::duration_cast<std::chrono::microseconds>(duration).count()
           << "ms";
    } else {
        os << std::chrono::duration_cast<std::chrono::microseconds>(duration).count() << "us";
    }
    os.fill(fill);
    return os.str();
}

}  // namespace rollnode
