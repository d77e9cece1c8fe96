// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

namespace rollnode::rpc {

enum ErrorCode : int64_t {
    /** Generic JSON-RPC API errors **/
    kParseError = -32700,      // Invalid JSON was received by the server
    kInvalidRequest = -32600,  // The JSON sent is not a valid Request object
    kMethodNotFound = -32601,  // The method does not exist / is not available
    kInvalidParams = -32602,   // Invalid method parameter(s)
    kInternalError = -32603,   // Internal JSON-RPC error
    kServerError = -32000,     // Generic client error while processing request
};

}  // namespace rollnode::rpc
