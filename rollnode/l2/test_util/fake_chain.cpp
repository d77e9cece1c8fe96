// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fake_chain.hpp"

#include <stdexcept>
#include <utility>

#include <rollnode/core/common/empty_hashes.hpp>
#include <rollnode/core/common/util.hpp>
#include <rollnode/core/protocol/validation.hpp>
#include <rollnode/core/types/evmc_bytes32.hpp>

namespace rollnode::l2::test_util {

using namespace evmc::literals;

static constexpr evmc::address kSequencer{0x0e5a1e0dd05c6cbb2b5f5e3a3e1dcbd8b1fb0ab5_address};
static constexpr evmc::address kRecipient{0x5df9b87991262f6ba471f09758cde1c0fc1de734_address};
static constexpr evmc::bytes32 kGenesisStateRoot{0x2a9f8b8c6e3e2ee9e4bcd1c1f59a8ec1d1c7a8b1c7de0fd7a0c5e4a3b2c1d0e9_bytes32};

ChainConfig test_chain_config() {
    return ChainConfig{
        .chain_id = kTestChainId,
        .london_block = 0,
        .terminal_total_difficulty = intx::uint256{0},
    };
}

Bytes sample_transaction(uint64_t nonce) {
    Transaction txn;
    txn.type = TransactionType::kLegacy;
    txn.chain_id = kTestChainId;
    txn.nonce = nonce;
    txn.max_priority_fee_per_gas = 1'000'000'000;
    txn.max_fee_per_gas = 1'000'000'000;
    txn.gas_limit = 21'000;
    txn.to = kRecipient;
    txn.value = 1'000 + nonce;
    txn.odd_y_parity = (nonce % 2) == 1;
    txn.r = intx::uint256{0xbeef} + nonce;
    txn.s = intx::uint256{0xcafe} + nonce;

    Bytes encoded;
    rlp::encode(encoded, txn, /*wrap_eip2718_into_string=*/false);
    return encoded;
}

std::vector<Bytes> sample_transactions(size_t count, uint64_t first_nonce) {
    std::vector<Bytes> transactions;
    for (uint64_t nonce{first_nonce}; nonce < first_nonce + count; ++nonce) {
        transactions.push_back(sample_transaction(nonce));
    }
    return transactions;
}

FakeChainStore::FakeChainStore(ChainConfig config) : config_{std::move(config)} {
    Block genesis;
    genesis.header.ommers_hash = kEmptyListHash;
    genesis.header.state_root = kGenesisStateRoot;
    genesis.header.transactions_root = kEmptyRoot;
    genesis.header.receipts_root = kEmptyRoot;
    genesis.header.difficulty = 1;
    genesis.header.gas_limit = kTestGasLimit;
    genesis.header.timestamp = 1'700'000'000;
    genesis.header.base_fee_per_gas = 1'000'000;
    chain_.push_back(std::move(genesis));
}

std::optional<BlockHeader> FakeChainStore::read_header(BlockNum block_num, const evmc::bytes32& block_hash) const {
    if (block_num >= chain_.size() || chain_[block_num].header.hash() != block_hash) {
        return std::nullopt;
    }
    return chain_[block_num].header;
}

void FakeChainStore::write_state_and_set_head(const Block& block,
                                              const std::vector<Receipt>& receipts,
                                              std::unique_ptr<state::StateSnapshot> state,
                                              std::chrono::nanoseconds /*execution_duration*/) {
    if (fail_writes) {
        throw std::runtime_error{"disk full"};
    }
    if (!state) {
        throw std::invalid_argument{"missing state"};
    }
    if (block.header.parent_hash != chain_.back().header.hash()) {
        throw std::runtime_error{"block does not extend the head"};
    }
    chain_.push_back(block);
    head_receipts_ = receipts;
    ++write_count_;
}

void FakeConsensusEngine::prepare(const protocol::ChainReader& /*chain*/, BlockHeader& header) {
    header.difficulty = 1;
}

ValidationResult FakeConsensusEngine::verify_header(const protocol::ChainReader& chain, const BlockHeader& header,
                                                    bool /*seal_present*/) {
    ++verify_calls_;
    if (header.number == 0) {
        return ValidationResult::kUnknownParent;
    }
    const std::optional<BlockHeader> parent{chain.read_header(header.number - 1, header.parent_hash)};
    if (!parent) {
        return ValidationResult::kUnknownParent;
    }
    if (header.difficulty != 1) {
        return ValidationResult::kWrongDifficulty;
    }
    if (header.extra_data.size() > kMaxExtraDataBytes) {
        return ValidationResult::kExtraDataTooLong;
    }
    if (header.gas_used > header.gas_limit) {
        return ValidationResult::kGasAboveLimit;
    }
    if (header.timestamp < parent->timestamp) {
        return ValidationResult::kInvalidTimestamp;
    }
    return ValidationResult::kOk;
}

evmc::bytes32 FakeBlockExecutor::post_state_root(const evmc::bytes32& parent_root,
                                                 const std::vector<Transaction>& transactions) {
    Bytes preimage{ByteView{parent_root.bytes}};
    for (const Transaction& txn : transactions) {
        const evmc::bytes32 txn_hash{txn.hash()};
        preimage.append(ByteView{txn_hash.bytes});
    }
    return to_bytes32(keccak256(preimage));
}

std::vector<Receipt> FakeBlockExecutor::make_receipts(const std::vector<Transaction>& transactions) {
    std::vector<Receipt> receipts;
    uint64_t cumulative_gas_used{0};
    for (const Transaction& txn : transactions) {
        cumulative_gas_used += txn.gas_limit;
        receipts.push_back(Receipt{
            .type = txn.type,
            .success = true,
            .cumulative_gas_used = cumulative_gas_used,
        });
    }
    return receipts;
}

execution::api::SealingBlock FakeBlockExecutor::build_sealing_block(const evmc::bytes32& parent_hash,
                                                                    BlockTime timestamp,
                                                                    const std::vector<Transaction>& transactions) {
    ++build_calls_;
    const BlockHeader parent{chain_.current_header()};
    if (parent.hash() != parent_hash) {
        throw std::runtime_error{"unknown parent " + to_hex(parent_hash, true)};
    }

    execution::api::SealingBlock sealing;
    Block& block{sealing.block};
    block.header.parent_hash = parent_hash;
    block.header.number = parent.number + 1;
    block.header.beneficiary = kSequencer;
    block.header.timestamp = timestamp;
    block.header.gas_limit = parent.gas_limit;
    block.header.base_fee_per_gas = parent.base_fee_per_gas;
    engine_.prepare(chain_, block.header);

    block.transactions = transactions;
    sealing.receipts = make_receipts(transactions);
    block.header.gas_used = sealing.receipts.empty() ? 0 : sealing.receipts.back().cumulative_gas_used;
    block.header.ommers_hash = kEmptyListHash;
    block.header.transactions_root = protocol::compute_transaction_root(block);
    block.header.receipts_root = protocol::compute_receipts_root(sealing.receipts);
    block.header.state_root = post_state_root(parent.state_root, transactions);
    sealing.state = std::make_unique<FakeStateSnapshot>(block.header.state_root);
    return sealing;
}

execution::api::ProcessedBlock FakeBlockExecutor::process_block(const Block& block, const BlockHeader& parent_header) {
    ++process_calls_;
    if (block.header.parent_hash != parent_header.hash()) {
        throw std::runtime_error{"block does not extend parent"};
    }
    execution::api::ProcessedBlock processed;
    processed.receipts = make_receipts(block.transactions);
    processed.gas_used = processed.receipts.empty() ? 0 : processed.receipts.back().cumulative_gas_used;
    processed.state = std::make_unique<FakeStateSnapshot>(post_state_root(parent_header.state_root, block.transactions));
    return processed;
}

}  // namespace rollnode::l2::test_util
