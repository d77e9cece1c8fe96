// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

#include <algorithm>
#include <cstring>

#include <rollnode/core/common/util.hpp>
#include <rollnode/core/rlp/encode.hpp>

namespace rollnode {

evmc::bytes32 to_bytes32(ByteView bytes) {
    evmc::bytes32 out;
    if (!bytes.empty()) {
        const size_t n{std::min(bytes.size(), kHashLength)};
        std::memcpy(out.bytes + kHashLength - n, bytes.data(), n);
    }
    return out;
}

evmc::bytes32 to_bytes32(const ethash::hash256& hash) {
    evmc::bytes32 out;
    std::memcpy(out.bytes, hash.bytes, kHashLength);
    return out;
}

std::string to_hex(const evmc::bytes32& value, bool with_prefix) {
    return rollnode::to_hex(ByteView{value.bytes}, with_prefix);
}

}  // namespace rollnode

namespace rollnode::rlp {

void encode(Bytes& to, const evmc::bytes32& value) {
    rollnode::rlp::encode(to, ByteView{value.bytes});
}

size_t length(const evmc::bytes32&) noexcept {
    return kHashLength + 1;
}

DecodingResult decode(ByteView& from, evmc::bytes32& to, Leftover mode) noexcept {
    return rollnode::rlp::decode(from, to.bytes, mode);
}

}  // namespace rollnode::rlp
