// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <rollnode/core/common/base.hpp>
#include <rollnode/core/common/bytes.hpp>
#include <rollnode/core/types/bloom.hpp>
#include <rollnode/core/types/bls_data.hpp>
#include <rollnode/core/types/transaction.hpp>

namespace rollnode {

struct BlockHeader {
    using NonceType = std::array<uint8_t, 8>;

    evmc::bytes32 parent_hash{};
    evmc::bytes32 ommers_hash{};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{};
    BlockNum number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    BlockTime timestamp{0};
    Bytes extra_data{};
    evmc::bytes32 mix_hash{};
    NonceType nonce{};

    std::optional<intx::uint256> base_fee_per_gas{std::nullopt};  // EIP-1559

    // Aggregate signature attached at commit time; part of the header identity when present
    std::optional<BlsData> bls_data{std::nullopt};

    //! \brief Keccak of the RLP encoding: the block content hash
    evmc::bytes32 hash() const;

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

struct BlockBody {
    std::vector<Transaction> transactions;
    std::vector<BlockHeader> ommers;

    friend bool operator==(const BlockBody&, const BlockBody&) = default;
};

struct Block : public BlockBody {
    BlockHeader header;

    friend bool operator==(const Block&, const Block&) = default;
};

namespace rlp {
    size_t length(const BlockHeader&);
    size_t length(const BlockBody&);

    //! \remarks BLS data is a trailing field after the base fee; when it is present without
    //! a base fee, the base fee slot is encoded as zero.
    void encode(Bytes& to, const BlockHeader&);
    void encode(Bytes& to, const BlockBody&);
    void encode(Bytes& to, const Block&);
}  // namespace rlp

}  // namespace rollnode
