// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

#include <magic_enum.hpp>

#include <rollnode/core/types/evmc_bytes32.hpp>

namespace rollnode::l2 {

bool L2Error::is_protocol_error() const noexcept {
    return code_ == L2ErrorCode::kDiscontinuousBlockNumber || code_ == L2ErrorCode::kWrongParentHash ||
           code_ == L2ErrorCode::kInvalidTransaction;
}

L2Error discontinuous_block_number(BlockNum actual, BlockNum expected) {
    return L2Error{L2ErrorCode::kDiscontinuousBlockNumber,
                   "cannot assemble block with discontinuous block number " + std::to_string(actual) +
                       ", expected number is " + std::to_string(expected)};
}

L2Error wrong_parent_hash(const evmc::bytes32& actual, const evmc::bytes32& expected) {
    return L2Error{L2ErrorCode::kWrongParentHash,
                   "wrong parent hash: " + to_hex(actual, /*with_prefix=*/true) +
                       ", expected parent hash is " + to_hex(expected, /*with_prefix=*/true)};
}

L2Error invalid_transaction(size_t index, DecodingError error) {
    return L2Error{L2ErrorCode::kInvalidTransaction,
                   "transaction " + std::to_string(index) + " is not valid: " + std::string{magic_enum::enum_name(error)},
                   index};
}

}  // namespace rollnode::l2
