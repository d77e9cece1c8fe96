// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include <rollnode/core/state/state_snapshot.hpp>
#include <rollnode/core/types/block.hpp>
#include <rollnode/core/types/receipt.hpp>

namespace rollnode::l2 {

//! Outcome of executing a block, kept until the block is committed or the round ends
struct ExecutionResult {
    Block block;
    std::unique_ptr<state::StateSnapshot> state;
    std::vector<Receipt> receipts;
    std::chrono::nanoseconds duration{0};
};

}  // namespace rollnode::l2
