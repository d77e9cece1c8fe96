// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <utility>

namespace rollnode::l2 {

ExecutableL2Data make_executable_l2_data(const Block& block) {
    const BlockHeader& header{block.header};
    ExecutableL2Data data{
        .parent_hash = header.parent_hash,
        .number = header.number,
        .miner = header.beneficiary,
        .timestamp = header.timestamp,
        .gas_limit = header.gas_limit,
        .base_fee = header.base_fee_per_gas,
        .extra_data = header.extra_data,
        .state_root = header.state_root,
        .gas_used = header.gas_used,
        .receipts_root = header.receipts_root,
        .logs_bloom = header.logs_bloom,
    };
    data.transactions.reserve(block.transactions.size());
    for (const Transaction& txn : block.transactions) {
        Bytes encoded;
        rlp::encode(encoded, txn, /*wrap_eip2718_into_string=*/false);
        data.transactions.push_back(std::move(encoded));
    }
    return data;
}

}  // namespace rollnode::l2
