// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <rollnode/core/common/base.hpp>
#include <rollnode/core/common/bytes.hpp>
#include <rollnode/core/types/block.hpp>
#include <rollnode/core/types/bloom.hpp>

namespace rollnode::l2 {

//! Wire-level block descriptor exchanged with the sequencer
struct ExecutableL2Data {
    evmc::bytes32 parent_hash{};
    BlockNum number{0};
    evmc::address miner{};
    BlockTime timestamp{0};
    uint64_t gas_limit{0};
    std::optional<intx::uint256> base_fee{std::nullopt};
    Bytes extra_data{};
    std::vector<Bytes> transactions{};  // EIP-2718 binary envelopes

    // Claimed by the proposer, only corroborated by local execution
    evmc::bytes32 state_root{};
    uint64_t gas_used{0};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};

    friend bool operator==(const ExecutableL2Data&, const ExecutableL2Data&) = default;
};

struct AssembleL2BlockParams {
    BlockNum number{0};
    std::vector<Bytes> transactions{};
};

//! \brief Builds the descriptor of an executed block, transactions in their canonical envelope
ExecutableL2Data make_executable_l2_data(const Block& block);

}  // namespace rollnode::l2
