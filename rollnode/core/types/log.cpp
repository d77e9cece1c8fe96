// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <rollnode/core/rlp/encode_vector.hpp>
#include <rollnode/core/types/address.hpp>
#include <rollnode/core/types/evmc_bytes32.hpp>

namespace rollnode::rlp {

static Header header(const Log& l) {
    return {.list = true, .payload_length = length(l.address) + length(l.topics) + length(l.data)};
}

size_t length(const Log& l) {
    const Header h{header(l)};
    return length_of_length(h.payload_length) + h.payload_length;
}

void encode(Bytes& to, const Log& l) {
    encode_header(to, header(l));
    encode(to, l.address);
    encode(to, l.topics);
    encode(to, l.data);
}

}  // namespace rollnode::rlp
