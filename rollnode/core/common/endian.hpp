// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// Big-endian helpers used by the RLP codec

#include <cstdint>
#include <cstring>

#include <intx/intx.hpp>

#include <rollnode/core/common/base.hpp>
#include <rollnode/core/common/bytes.hpp>
#include <rollnode/core/common/decoding_result.hpp>

namespace rollnode::endian {

// NOLINTBEGIN(readability-identifier-naming)
const auto store_big_u64 = intx::be::unsafe::store<uint64_t>;
// NOLINTEND(readability-identifier-naming)

//! \brief Transforms a uint64_t to its compacted big endian byte form (leftmost zero bytes stripped)
//! \remarks The returned view points into a thread local buffer overwritten by the next call
ByteView to_big_compact(uint64_t value);

//! \brief Same as above for intx::uint256
ByteView to_big_compact(const intx::uint256& value);

//! \brief Parses unsigned integer from a compacted big endian byte form.
//! \return Success or kOverflow (input longer than T) or kLeadingZero (input not compact).
template <UnsignedIntegral T>
static DecodingResult from_big_compact(ByteView data, T& out) {
    if (data.size() > sizeof(T)) {
        return tl::unexpected{DecodingError::kOverflow};
    }

    out = 0;
    if (data.empty()) {
        return {};
    }

    if (data[0] == 0) {
        return tl::unexpected{DecodingError::kLeadingZero};
    }

    auto* ptr{reinterpret_cast<uint8_t*>(&out)};
    std::memcpy(ptr + (sizeof(T) - data.size()), &data[0], data.size());

    out = intx::to_big_endian(out);
    return {};
}

}  // namespace rollnode::endian
