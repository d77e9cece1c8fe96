// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

namespace rollnode::state {

//! \brief Post-execution world state produced by the executor and consumed by the chain store.
//! The node never inspects a snapshot beyond its root; ownership travels as std::unique_ptr.
class StateSnapshot {
  public:
    StateSnapshot() = default;

    // Move-only
    StateSnapshot(StateSnapshot&& other) = default;
    StateSnapshot& operator=(StateSnapshot&& other) = default;

    virtual ~StateSnapshot() = default;

    virtual evmc::bytes32 state_root() const = 0;
};

}  // namespace rollnode::state
