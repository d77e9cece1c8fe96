// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <map>
#include <optional>

#include <evmc/evmc.hpp>

#include <rollnode/l2/execution_result.hpp>

namespace rollnode::l2 {

//! \brief Execution results of the current proposal round, keyed by block content hash.
//! Entries are never evicted one by one: the whole table is dropped when the head moves.
//! \warning Not thread-safe, the owner serializes access
class VerifiedResults {
  public:
    static constexpr size_t kDefaultWarnThreshold{64};

    explicit VerifiedResults(size_t warn_threshold = kDefaultWarnThreshold) : warn_threshold_{warn_threshold} {}

    VerifiedResults(const VerifiedResults&) = delete;
    VerifiedResults& operator=(const VerifiedResults&) = delete;

    bool contains(const evmc::bytes32& block_hash) const { return results_.contains(block_hash); }

    //! \brief Stores the result under block_hash, replacing any previous one
    void insert(const evmc::bytes32& block_hash, ExecutionResult result);

    //! \brief Moves the result out of the table
    std::optional<ExecutionResult> take(const evmc::bytes32& block_hash);

    void clear() noexcept { results_.clear(); }

    size_t size() const noexcept { return results_.size(); }

  private:
    size_t warn_threshold_;
    std::map<evmc::bytes32, ExecutionResult> results_;
};

}  // namespace rollnode::l2
