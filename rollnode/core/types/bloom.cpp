// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "bloom.hpp"

#include <rollnode/core/common/util.hpp>

namespace rollnode {

void m3_2048(Bloom& bloom, ByteView x) {
    const ethash::hash256 hash{keccak256(x)};
    for (size_t i{0}; i < 6; i += 2) {
        const unsigned bit{static_cast<unsigned>(hash.bytes[i + 1] + (hash.bytes[i] << 8)) & 0x7FFu};
        bloom[kBloomByteLength - 1 - bit / 8] |= static_cast<uint8_t>(1u << (bit % 8));
    }
}

Bloom logs_bloom(const std::vector<Log>& logs) {
    Bloom bloom{};
    for (const Log& log : logs) {
        m3_2048(bloom, log.address.bytes);
        for (const auto& topic : log.topics) {
            m3_2048(bloom, topic.bytes);
        }
    }
    return bloom;
}

}  // namespace rollnode
