// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>

#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <rollnode/core/common/base.hpp>

namespace rollnode {

using ChainId = uint64_t;

//! \brief Layer-2 specific block policies
struct L2Config {
    //! \brief Maximum number of transactions in a block, unlimited if not set
    std::optional<uint64_t> max_tx_per_block{std::nullopt};

    bool operator==(const L2Config&) const = default;
};

struct ChainConfig {
    //! \brief Returns the chain identifier
    //! \see https://eips.ethereum.org/EIPS/eip-155
    ChainId chain_id{0};

    //! \brief The block from which headers carry a base fee (EIP-1559)
    std::optional<BlockNum> london_block{std::nullopt};

    //! \brief Required for the control API to start: the chain is driven by an external consensus process
    //! \see EIP-3675: Upgrade consensus to Proof-of-Stake
    std::optional<intx::uint256> terminal_total_difficulty{std::nullopt};

    L2Config l2{};

    //! \brief Whether a block with the given number of transactions satisfies the chain policy
    bool is_valid_tx_count(size_t count) const noexcept;

    bool is_london(BlockNum block_num) const noexcept { return london_block && block_num >= *london_block; }

    //! \brief Return the JSON representation of this object
    nlohmann::json to_json() const noexcept;

    //! \brief Try parse a JSON object into strongly typed ChainConfig
    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<ChainConfig> from_json(const nlohmann::json& json) noexcept;

    bool operator==(const ChainConfig&) const = default;
};

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj);

}  // namespace rollnode
