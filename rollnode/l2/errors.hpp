// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include <evmc/evmc.hpp>

#include <rollnode/core/common/base.hpp>
#include <rollnode/core/common/decoding_result.hpp>

namespace rollnode::l2 {

enum class L2ErrorCode {
    // The caller view of the chain is stale or its input is malformed
    kDiscontinuousBlockNumber,
    kWrongParentHash,
    kInvalidTransaction,

    // A block asserted as head does not pass verification
    kVerificationFailed,

    // Faults of the executor or of the chain store
    kExecutionFailed,
    kStoreFailed,
};

class L2Error : public std::runtime_error {
  public:
    L2Error(L2ErrorCode code, const std::string& message, std::optional<size_t> transaction_index = std::nullopt)
        : std::runtime_error{message}, code_{code}, transaction_index_{transaction_index} {}

    L2ErrorCode code() const noexcept { return code_; }

    //! \brief Index of the offending transaction, only for kInvalidTransaction
    std::optional<size_t> transaction_index() const noexcept { return transaction_index_; }

    //! \brief Whether the error is due to the request rather than to a local fault
    bool is_protocol_error() const noexcept;

  private:
    L2ErrorCode code_;
    std::optional<size_t> transaction_index_;
};

L2Error discontinuous_block_number(BlockNum actual, BlockNum expected);
L2Error wrong_parent_hash(const evmc::bytes32& actual, const evmc::bytes32& expected);
L2Error invalid_transaction(size_t index, DecodingError error);

}  // namespace rollnode::l2
