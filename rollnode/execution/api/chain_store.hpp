// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include <rollnode/core/protocol/chain_reader.hpp>
#include <rollnode/core/state/state_snapshot.hpp>
#include <rollnode/core/types/block.hpp>
#include <rollnode/core/types/receipt.hpp>

namespace rollnode::execution::api {

//! Persistent chain: canonical head accessors plus the commit entry point
struct ChainStore : public protocol::ChainReader {
    ~ChainStore() override = default;

    virtual Block current_block() const = 0;

    //! \brief Persists the post state and receipts of block and makes it the canonical head
    //! \throws std::runtime_error on write failure, in which case the head is unchanged
    virtual void write_state_and_set_head(const Block& block,
                                          const std::vector<Receipt>& receipts,
                                          std::unique_ptr<state::StateSnapshot> state,
                                          std::chrono::nanoseconds execution_duration) = 0;
};

}  // namespace rollnode::execution::api
