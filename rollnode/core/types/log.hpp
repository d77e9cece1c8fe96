// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <evmc/evmc.hpp>

#include <rollnode/core/common/bytes.hpp>

namespace rollnode {

struct Log {
    evmc::address address;
    std::vector<evmc::bytes32> topics;
    Bytes data;

    friend bool operator==(const Log&, const Log&) = default;
};

namespace rlp {
    size_t length(const Log&);
    void encode(Bytes& to, const Log&);
}  // namespace rlp

}  // namespace rollnode
