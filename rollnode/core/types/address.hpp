// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>

#include <evmc/evmc.hpp>

#include <rollnode/core/common/bytes.hpp>
#include <rollnode/core/common/decoding_result.hpp>
#include <rollnode/core/rlp/decode.hpp>

namespace rollnode {

// Converts bytes to evmc::address; input is cropped if necessary.
// Short inputs are left-padded with 0s.
evmc::address bytes_to_address(ByteView bytes);

std::string address_to_hex(const evmc::address& address);

namespace rlp {
    void encode(Bytes& to, const evmc::address& address);
    DecodingResult decode(ByteView& from, evmc::address& address, Leftover mode = Leftover::kProhibit) noexcept;
    size_t length(const evmc::address& address) noexcept;
}  // namespace rlp

}  // namespace rollnode

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address);

}  // namespace evmc
