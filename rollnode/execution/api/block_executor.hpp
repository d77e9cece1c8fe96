// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <vector>

#include <evmc/evmc.hpp>

#include <rollnode/core/common/base.hpp>
#include <rollnode/core/state/state_snapshot.hpp>
#include <rollnode/core/types/block.hpp>
#include <rollnode/core/types/receipt.hpp>

namespace rollnode::execution::api {

//! Block built and executed by the miner on top of a given parent, ready to be sealed
struct SealingBlock {
    Block block;
    std::unique_ptr<state::StateSnapshot> state;
    std::vector<Receipt> receipts;
};

//! Outcome of re-executing a block received from elsewhere
struct ProcessedBlock {
    std::unique_ptr<state::StateSnapshot> state;
    std::vector<Receipt> receipts;
    uint64_t gas_used{0};
};

//! State-transition executor. Every failure is reported by throwing.
struct BlockExecutor {
    virtual ~BlockExecutor() = default;

    virtual SealingBlock build_sealing_block(const evmc::bytes32& parent_hash,
                                             BlockTime timestamp,
                                             const std::vector<Transaction>& transactions) = 0;

    virtual ProcessedBlock process_block(const Block& block, const BlockHeader& parent_header) = 0;
};

}  // namespace rollnode::execution::api
