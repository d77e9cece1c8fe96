// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic concepts, types, and constants.

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

#include <intx/intx.hpp>

#include <rollnode/core/common/assert.hpp>

namespace rollnode {

using namespace std::string_view_literals;

template <class T>
concept UnsignedIntegral = std::unsigned_integral<T> || std::same_as<T, intx::uint128> ||
                           std::same_as<T, intx::uint256> || std::same_as<T, intx::uint512>;

using BlockNum = uint64_t;
inline constexpr BlockNum kMaxBlockNum = std::numeric_limits<BlockNum>::max();

using BlockTime = uint64_t;

inline constexpr size_t kAddressLength{20};
inline constexpr size_t kHashLength{32};

inline constexpr uint64_t kGiga{1'000'000'000};  // = 10^9

}  // namespace rollnode
