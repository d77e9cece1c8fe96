// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <rollnode/core/rlp/encode_vector.hpp>

namespace rollnode::rlp {

static Header header(const Receipt& r) {
    Header h{.list = true};
    h.payload_length = length(r.success);
    h.payload_length += length(r.cumulative_gas_used);
    h.payload_length += length(ByteView{r.bloom});
    h.payload_length += length(r.logs);
    return h;
}

// Typed receipts are prefixed with their transaction type, as in EIP-2718
void encode(Bytes& to, const Receipt& r) {
    if (r.type != TransactionType::kLegacy) {
        to.push_back(static_cast<uint8_t>(r.type));
    }
    encode_header(to, header(r));
    encode(to, r.success);
    encode(to, r.cumulative_gas_used);
    encode(to, ByteView{r.bloom});
    encode(to, r.logs);
}

}  // namespace rollnode::rlp
