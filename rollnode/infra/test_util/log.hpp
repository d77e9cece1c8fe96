// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include <rollnode/infra/common/log.hpp>

namespace rollnode::test_util {

//! Utility class using RAII to change the log verbosity level (necessary to make tests work in shuffled order)
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level new_level) : current_level_(log::get_verbosity()) {
        log::set_verbosity(new_level);
    }
    ~SetLogVerbosityGuard() { log::set_verbosity(current_level_); }

  private:
    log::Level current_level_;
};

//! Utility class using RAII to swap the underlying buffers of the provided streams
class StreamSwap {
  public:
    StreamSwap(std::ostream& o1, std::ostream& o2) : buffer_(o1.rdbuf()), stream_(o1) { o1.rdbuf(o2.rdbuf()); }
    ~StreamSwap() { stream_.rdbuf(buffer_); }

  private:
    std::streambuf* buffer_;
    std::ostream& stream_;
};

//! Redirects log lines at or above the given level into a buffer for the lifetime of the object
class LogCapture {
  public:
    explicit LogCapture(log::Level level = log::Level::kInfo)
        : verbosity_guard_{level}, cerr_swap_{std::cerr, captured_} {
        log::init(log::Settings{.log_nocolor = true, .log_verbosity = level});
    }

    std::string lines() const { return captured_.str(); }
    bool contains(std::string_view text) const { return lines().find(text) != std::string::npos; }

  private:
    SetLogVerbosityGuard verbosity_guard_;
    std::stringstream captured_;
    StreamSwap cerr_swap_;
};

}  // namespace rollnode::test_util
