// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bls_data.hpp"

#include <rollnode/core/rlp/encode_vector.hpp>

namespace rollnode::rlp {

// Encoded as [signature, [signers...]]

size_t length(const BlsData& bls) {
    return length(bls.signature, bls.signers);
}

void encode(Bytes& to, const BlsData& bls) {
    encode(to, bls.signature, bls.signers);
}

}  // namespace rollnode::rlp
