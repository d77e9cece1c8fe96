// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "body_validator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rollnode/core/common/empty_hashes.hpp>

namespace rollnode::execution {

TEST_CASE("ChainBodyValidator", "[rollnode][execution][body_validator]") {
    ChainConfig config{.chain_id = 1, .london_block = 0};
    ChainBodyValidator validator{config};

    Block block;
    block.header.number = 1;
    block.header.gas_limit = 30'000'000;
    block.header.ommers_hash = kEmptyListHash;
    block.header.transactions_root = kEmptyRoot;
    CHECK(validator.validate_body(block) == ValidationResult::kOk);

    block.transactions.emplace_back();
    CHECK(validator.validate_body(block) == ValidationResult::kWrongTransactionsRoot);

    block.header.transactions_root = protocol::compute_transaction_root(block);
    config.l2.max_tx_per_block = 0;
    CHECK(validator.validate_body(block) == ValidationResult::kTooManyTransactions);
}

}  // namespace rollnode::execution
