// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "address.hpp"

#include <algorithm>
#include <cstring>

#include <rollnode/core/common/util.hpp>
#include <rollnode/core/rlp/encode.hpp>

namespace rollnode {

evmc::address bytes_to_address(ByteView bytes) {
    evmc::address out;
    if (!bytes.empty()) {
        const size_t n{std::min(bytes.size(), kAddressLength)};
        std::memcpy(out.bytes + kAddressLength - n, bytes.data(), n);
    }
    return out;
}

std::string address_to_hex(const evmc::address& address) {
    return to_hex(ByteView{address.bytes}, /*with_prefix=*/true);
}

namespace rlp {

    void encode(Bytes& to, const evmc::address& address) {
        encode(to, ByteView{address.bytes});
    }

    DecodingResult decode(ByteView& from, evmc::address& address, Leftover mode) noexcept {
        return decode(from, address.bytes, mode);
    }

    size_t length(const evmc::address&) noexcept {
        return kAddressLength + 1;
    }

}  // namespace rlp

}  // namespace rollnode

namespace evmc {

std::ostream& operator<<(std::ostream& out, const evmc::address& address) {
    out << rollnode::address_to_hex(address);
    return out;
}

}  // namespace evmc
