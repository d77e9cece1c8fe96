// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "validation.hpp"

#include <magic_enum.hpp>

#include <rollnode/core/common/empty_hashes.hpp>
#include <rollnode/core/common/util.hpp>
#include <rollnode/core/rlp/encode_vector.hpp>
#include <rollnode/core/trie/vector_root.hpp>
#include <rollnode/core/types/evmc_bytes32.hpp>

namespace rollnode::protocol {

std::string_view to_string(ValidationResult result) {
    return magic_enum::enum_name(result);
}

evmc::bytes32 compute_transaction_root(const BlockBody& body) {
    static constexpr auto kEncoder = [](Bytes& to, const Transaction& txn) {
        rlp::encode(to, txn, /*wrap_eip2718_into_string=*/false);
    };
    return trie::root_hash(body.transactions, kEncoder);
}

evmc::bytes32 compute_receipts_root(const std::vector<Receipt>& receipts) {
    static constexpr auto kEncoder = [](Bytes& to, const Receipt& r) { rlp::encode(to, r); };
    return trie::root_hash(receipts, kEncoder);
}

evmc::bytes32 compute_ommers_hash(const BlockBody& body) {
    if (body.ommers.empty()) {
        return kEmptyListHash;
    }

    Bytes ommers_rlp;
    rlp::encode(ommers_rlp, body.ommers);
    return to_bytes32(keccak256(ommers_rlp));
}

ValidationResult pre_validate_block_body(const Block& block, const ChainConfig& config) {
    const BlockHeader& header{block.header};

    if (header.gas_used > header.gas_limit) {
        return ValidationResult::kGasAboveLimit;
    }

    const evmc::bytes32 txn_root{compute_transaction_root(block)};
    if (txn_root != header.transactions_root) {
        return ValidationResult::kWrongTransactionsRoot;
    }

    if (!config.is_valid_tx_count(block.transactions.size())) {
        return ValidationResult::kTooManyTransactions;
    }

    if (!config.is_london(header.number)) {
        for (const Transaction& txn : block.transactions) {
            if (txn.type == TransactionType::kDynamicFee) {
                return ValidationResult::kUnsupportedTransactionType;
            }
        }
    }

    if (!block.ommers.empty()) {
        return ValidationResult::kTooManyOmmers;
    }
    return header.ommers_hash == kEmptyListHash ? ValidationResult::kOk : ValidationResult::kWrongOmmersHash;
}

}  // namespace rollnode::protocol
