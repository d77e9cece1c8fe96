// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "y_parity_and_chain_id.hpp"

namespace rollnode {

intx::uint256 y_parity_and_chain_id_to_v(bool odd, const std::optional<intx::uint256>& chain_id) noexcept {
    if (chain_id) {
        return *chain_id * 2 + 35 + odd;
    }
    return odd ? 28 : 27;
}

std::optional<YParityAndChainId> v_to_y_parity_and_chain_id(const intx::uint256& v) noexcept {
    if (v == 27 || v == 28) {
        // pre EIP-155
        return YParityAndChainId{.odd = v == 28, .chain_id = std::nullopt};
    }
    if (v < 35) {
        return std::nullopt;
    }
    // v = chain_id * 2 + 35 + y_parity
    const intx::uint256 w{v - 35};
    return YParityAndChainId{.odd = (static_cast<uint64_t>(w) % 2) != 0, .chain_id = w >> 1};
}

}  // namespace rollnode
