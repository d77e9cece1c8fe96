// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <rollnode/core/common/bytes.hpp>

namespace rollnode {

// Aggregate-signature payload supplied out of band by the sequencer when a block is committed.
// Its content is opaque here: it only takes part in the header identity.
struct BlsData {
    std::vector<Bytes> signers;
    Bytes signature;

    bool empty() const noexcept { return signers.empty() && signature.empty(); }

    friend bool operator==(const BlsData&, const BlsData&) = default;
};

namespace rlp {
    size_t length(const BlsData&);
    void encode(Bytes& to, const BlsData&);
}  // namespace rlp

}  // namespace rollnode
