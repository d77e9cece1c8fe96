// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include <rollnode/core/chain/config.hpp>
#include <rollnode/core/protocol/consensus_engine.hpp>
#include <rollnode/execution/api/block_executor.hpp>
#include <rollnode/execution/api/chain_store.hpp>

namespace rollnode::l2::test_util {

inline constexpr ChainId kTestChainId{534352};
inline constexpr uint64_t kTestGasLimit{10'000'000};

//! Chain configuration ready for the control API
ChainConfig test_chain_config();

//! Encoded legacy EIP-155 transfer, distinct per nonce
Bytes sample_transaction(uint64_t nonce);
std::vector<Bytes> sample_transactions(size_t count, uint64_t first_nonce = 0);

class FakeStateSnapshot : public state::StateSnapshot {
  public:
    explicit FakeStateSnapshot(const evmc::bytes32& root) : root_{root} {}

    evmc::bytes32 state_root() const override { return root_; }

  private:
    evmc::bytes32 root_;
};

//! In-memory canonical chain starting from a fixed genesis
class FakeChainStore : public execution::api::ChainStore {
  public:
    explicit FakeChainStore(ChainConfig config = test_chain_config());

    const ChainConfig& config() const override { return config_; }
    BlockHeader current_header() const override { return chain_.back().header; }
    std::optional<BlockHeader> read_header(BlockNum block_num, const evmc::bytes32& block_hash) const override;

    Block current_block() const override { return chain_.back(); }
    void write_state_and_set_head(const Block& block,
                                  const std::vector<Receipt>& receipts,
                                  std::unique_ptr<state::StateSnapshot> state,
                                  std::chrono::nanoseconds execution_duration) override;

    const std::vector<Block>& chain() const { return chain_; }
    size_t write_count() const { return write_count_; }
    const std::vector<Receipt>& head_receipts() const { return head_receipts_; }

    bool fail_writes{false};

  private:
    ChainConfig config_;
    std::vector<Block> chain_;
    std::vector<Receipt> head_receipts_;
    size_t write_count_{0};
};

//! Engine with difficulty one and plain header rules
class FakeConsensusEngine : public protocol::ConsensusEngine {
  public:
    static constexpr size_t kMaxExtraDataBytes{32};

    void prepare(const protocol::ChainReader& chain, BlockHeader& header) override;
    ValidationResult verify_header(const protocol::ChainReader& chain, const BlockHeader& header, bool seal_present) override;

    size_t verify_calls() const { return verify_calls_; }

  private:
    std::atomic<size_t> verify_calls_{0};
};

//! Deterministic executor: every transaction burns its gas limit and the post state root is
//! the hash of the parent root followed by the transaction hashes
class FakeBlockExecutor : public execution::api::BlockExecutor {
  public:
    FakeBlockExecutor(protocol::ConsensusEngine& engine, const protocol::ChainReader& chain)
        : engine_{engine}, chain_{chain} {}

    execution::api::SealingBlock build_sealing_block(const evmc::bytes32& parent_hash,
                                                     BlockTime timestamp,
                                                     const std::vector<Transaction>& transactions) override;

    execution::api::ProcessedBlock process_block(const Block& block, const BlockHeader& parent_header) override;

    size_t build_calls() const { return build_calls_; }
    size_t process_calls() const { return process_calls_; }

    static evmc::bytes32 post_state_root(const evmc::bytes32& parent_root, const std::vector<Transaction>& transactions);
    static std::vector<Receipt> make_receipts(const std::vector<Transaction>& transactions);

  private:
    protocol::ConsensusEngine& engine_;
    const protocol::ChainReader& chain_;
    std::atomic<size_t> build_calls_{0};
    std::atomic<size_t> process_calls_{0};
};

}  // namespace rollnode::l2::test_util
