// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <rollnode/core/types/log.hpp>

namespace rollnode {

inline constexpr size_t kBloomByteLength{256};

using Bloom = std::array<uint8_t, kBloomByteLength>;

//! See Section 4.3.1 "Transaction Receipt" of the Yellow Paper
void m3_2048(Bloom& bloom, ByteView x);

Bloom logs_bloom(const std::vector<Log>& logs);

}  // namespace rollnode
