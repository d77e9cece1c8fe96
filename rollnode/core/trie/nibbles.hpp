// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rollnode/core/common/base.hpp>
#include <rollnode/core/common/bytes.hpp>

namespace rollnode::trie {

//! \brief Transforms a string of bytes into a string of nibbles, one nibble [0..16) per byte
Bytes unpack_nibbles(ByteView data);

//! \brief Hex-prefix ("compact") encoding of a nibble path, with the leaf terminator flag
//! \see Appendix C "Hex-Prefix Encoding" of the Yellow Paper
Bytes encode_path(ByteView nibbles, bool terminating);

}  // namespace rollnode::trie
