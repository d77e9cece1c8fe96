// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <ethash/hash_types.hpp>
#include <evmc/evmc.hpp>

#include <rollnode/core/common/bytes.hpp>
#include <rollnode/core/rlp/decode.hpp>

namespace rollnode {

// Converts bytes to evmc::bytes32; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::bytes32 to_bytes32(ByteView bytes);

evmc::bytes32 to_bytes32(const ethash::hash256& hash);

std::string to_hex(const evmc::bytes32& value, bool with_prefix = false);

}  // namespace rollnode

namespace rollnode::rlp {

void encode(Bytes& to, const evmc::bytes32& value);
size_t length(const evmc::bytes32& value) noexcept;
DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode = Leftover::kProhibit) noexcept;

}  // namespace rollnode::rlp

namespace evmc {

// Make the overloads above visible to unqualified calls inside the generic RLP templates
using rollnode::rlp::encode;
using rollnode::rlp::length;

}  // namespace evmc
