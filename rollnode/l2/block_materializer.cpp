// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_materializer.hpp"

#include <utility>

#include <rollnode/core/common/empty_hashes.hpp>
#include <rollnode/core/protocol/validation.hpp>
#include <rollnode/l2/errors.hpp>

namespace rollnode::l2 {

std::vector<Transaction> decode_transactions(const std::vector<Bytes>& encoded_transactions) {
    std::vector<Transaction> transactions;
    transactions.reserve(encoded_transactions.size());
    for (size_t i{0}; i < encoded_transactions.size(); ++i) {
        ByteView encoded{encoded_transactions[i]};
        Transaction txn;
        if (const auto res{rlp::decode_transaction(encoded, txn, rlp::Eip2718Wrapping::kNone)}; !res) {
            throw invalid_transaction(i, res.error());
        }
        transactions.push_back(std::move(txn));
    }
    return transactions;
}

Block BlockMaterializer::materialize(const ExecutableL2Data& data, const BlsData& bls) const {
    Block block;
    BlockHeader& header{block.header};
    header.parent_hash = data.parent_hash;
    header.number = data.number;
    header.gas_used = data.gas_used;
    header.gas_limit = data.gas_limit;
    header.timestamp = data.timestamp;
    header.beneficiary = data.miner;
    header.extra_data = data.extra_data;
    header.base_fee_per_gas = data.base_fee;
    if (!bls.empty()) {
        header.bls_data = bls;
    }
    engine_.prepare(chain_, header);

    block.transactions = decode_transactions(data.transactions);

    header.ommers_hash = kEmptyListHash;
    header.transactions_root = protocol::compute_transaction_root(block);
    header.receipts_root = data.receipts_root;
    header.state_root = data.state_root;
    header.logs_bloom = data.logs_bloom;
    return block;
}

}  // namespace rollnode::l2
