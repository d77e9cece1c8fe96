// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "nibbles.hpp"

namespace rollnode::trie {

Bytes unpack_nibbles(ByteView data) {
    Bytes out(2 * data.size(), '\0');
    size_t offset{0};
    for (const auto& b : data) {
        out[offset] = b >> 4;
        out[offset + 1] = b & 0x0F;
        offset += 2;
    }
    return out;
}

Bytes encode_path(ByteView nibbles, bool terminating) {
    Bytes res(nibbles.size() / 2 + 1, '\0');
    const bool odd{nibbles.size() % 2 != 0};

    res[0] = terminating ? 0x20 : 0x00;
    if (odd) {
        res[0] |= 0x10 | nibbles[0];
        nibbles.remove_prefix(1);
    }

    for (size_t i{1}; i < res.size(); ++i) {
        res[i] = static_cast<uint8_t>((nibbles[0] << 4) + nibbles[1]);
        nibbles.remove_prefix(2);
    }
    return res;
}

}  // namespace rollnode::trie
