// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <evmc/evmc.hpp>

#include <rollnode/core/chain/config.hpp>
#include <rollnode/core/types/block.hpp>

namespace rollnode::protocol {

//! \brief Read-only view of the local chain offered to the consensus engine
class ChainReader {
  public:
    virtual ~ChainReader() = default;

    virtual const ChainConfig& config() const = 0;

    //! \brief Header of the current canonical head
    virtual BlockHeader current_header() const = 0;

    virtual std::optional<BlockHeader> read_header(BlockNum block_num, const evmc::bytes32& block_hash) const = 0;
};

}  // namespace rollnode::protocol
