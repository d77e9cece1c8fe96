// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "verified_results.hpp"

#include <string>
#include <utility>

#include <rollnode/core/types/evmc_bytes32.hpp>
#include <rollnode/infra/common/log.hpp>

namespace rollnode::l2 {

void VerifiedResults::insert(const evmc::bytes32& block_hash, ExecutionResult result) {
    results_.insert_or_assign(block_hash, std::move(result));
    if (warn_threshold_ > 0 && results_.size() % warn_threshold_ == 0) {
        ROLL_WARN_M("VerifiedResults", {"size", std::to_string(results_.size()), "last", to_hex(block_hash, true)})
            << "execution results keep growing without a commit";
    }
}

std::optional<ExecutionResult> VerifiedResults::take(const evmc::bytes32& block_hash) {
    auto node{results_.extract(block_hash)};
    if (node.empty()) {
        return std::nullopt;
    }
    return std::move(node.mapped());
}

}  // namespace rollnode::l2
