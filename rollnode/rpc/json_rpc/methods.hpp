// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace rollnode::rpc::json_rpc::method {

// Constants defined here have a different naming from our standard: k_<JSON_RPC_API>
// where <JSON_RPC_API> is *exactly* the JSON RPC API method

// NOLINTBEGIN(readability-identifier-naming)

inline constexpr const char* k_engine_assembleL2Block{"engine_assembleL2Block"};
inline constexpr const char* k_engine_validateL2Block{"engine_validateL2Block"};
inline constexpr const char* k_engine_newL2Block{"engine_newL2Block"};

// NOLINTEND(readability-identifier-naming)

}  // namespace rollnode::rpc::json_rpc::method
