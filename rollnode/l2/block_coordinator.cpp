// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_coordinator.hpp"

#include <string>
#include <utility>

#include <rollnode/core/common/empty_hashes.hpp>
#include <rollnode/core/protocol/validation.hpp>
#include <rollnode/core/types/evmc_bytes32.hpp>
#include <rollnode/infra/common/ensure.hpp>
#include <rollnode/infra/common/log.hpp>
#include <rollnode/infra/common/stopwatch.hpp>
#include <rollnode/l2/errors.hpp>

namespace rollnode::l2 {

static BlockTime now_in_seconds() {
    const auto now{std::chrono::system_clock::now().time_since_epoch()};
    return static_cast<BlockTime>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

BlockCoordinator::BlockCoordinator(protocol::ConsensusEngine& engine,
                                   execution::api::BlockExecutor& executor,
                                   execution::api::ChainStore& store,
                                   execution::api::BodyValidator& body_validator,
                                   CoordinatorSettings settings)
    : engine_{engine},
      executor_{executor},
      store_{store},
      body_validator_{body_validator},
      settings_{settings},
      materializer_{engine, store},
      verified_{settings.verified_results_warn_threshold} {}

std::optional<ExecutableL2Data> BlockCoordinator::assemble_l2_block(const AssembleL2BlockParams& params) {
    std::scoped_lock lock{mutex_};

    ROLL_INFO_M("Producing block", {"number", std::to_string(params.number),
                                    "txs", std::to_string(params.transactions.size())});

    const BlockHeader parent{store_.current_header()};
    const BlockNum expected_block_num{parent.number + 1};
    if (params.number != expected_block_num) {
        ROLL_WARN_M("Cannot assemble block with discontinuous block number",
                    {"expected", std::to_string(expected_block_num), "actual", std::to_string(params.number)});
        throw discontinuous_block_number(params.number, expected_block_num);
    }
    const std::vector<Transaction> transactions{decode_transactions(params.transactions)};

    StopWatch sw{StopWatch::kStart};
    execution::api::SealingBlock sealing;
    try {
        sealing = executor_.build_sealing_block(parent.hash(), now_in_seconds(), transactions);
    } catch (const std::exception& e) {
        ROLL_ERROR_M("Failed to build sealing block", {"number", std::to_string(params.number), "error", e.what()});
        throw L2Error{L2ErrorCode::kExecutionFailed, e.what()};
    }
    const auto duration{sw.since_start()};
    ensure(sealing.state != nullptr, "BlockExecutor: sealing block without post state");

    // Nothing to propose: no candidate, no cached result
    if (sealing.block.header.transactions_root == kEmptyRoot) {
        ROLL_INFO_M("Skipping empty block", {"number", std::to_string(params.number)});
        return std::nullopt;
    }

    const evmc::bytes32 block_hash{sealing.block.header.hash()};
    ExecutableL2Data data{make_executable_l2_data(sealing.block)};
    ROLL_INFO_M("Assembled block", {"number", std::to_string(data.number),
                                    "hash", to_hex(block_hash, true),
                                    "txs", std::to_string(data.transactions.size()),
                                    "elapsed", StopWatch::format(duration)});
    verified_.insert(block_hash, ExecutionResult{
                                     .block = std::move(sealing.block),
                                     .state = std::move(sealing.state),
                                     .receipts = std::move(sealing.receipts),
                                     .duration = duration,
                                 });
    return data;
}

bool BlockCoordinator::validate_l2_block(const ExecutableL2Data& data) {
    std::scoped_lock lock{mutex_};

    const Block head{store_.current_block()};
    Block block{materialize_on_head(data, /*bls=*/{}, head)};
    const evmc::bytes32 block_hash{block.header.hash()};
    if (verified_.contains(block_hash)) {
        ROLL_DEBUG_M("Block already verified", {"number", std::to_string(data.number), "hash", to_hex(block_hash, true)});
        return true;
    }

    if (const ValidationResult result{verify_block(block)}; result != ValidationResult::kOk) {
        ROLL_WARN_M("Failed to verify block", {"number", std::to_string(data.number),
                                               "result", std::string{protocol::to_string(result)}});
        return false;
    }
    if (const ValidationResult result{body_validator_.validate_body(block)}; result != ValidationResult::kOk) {
        ROLL_ERROR_M("error validating body", {"number", std::to_string(data.number),
                                               "result", std::string{protocol::to_string(result)}});
        return false;
    }

    StopWatch sw{StopWatch::kStart};
    execution::api::ProcessedBlock processed;
    try {
        processed = executor_.process_block(block, head.header);
    } catch (const std::exception& e) {
        ROLL_ERROR_M("error processing block", {"number", std::to_string(data.number), "error", e.what()});
        return false;
    }
    const auto duration{sw.since_start()};
    ensure(processed.state != nullptr, "BlockExecutor: processed block without post state");

    if (verify_execution_roots(block, *processed.state, processed.receipts) != ValidationResult::kOk) {
        return false;
    }

    ROLL_INFO_M("Validated block", {"number", std::to_string(data.number),
                                    "hash", to_hex(block_hash, true),
                                    "elapsed", StopWatch::format(duration)});
    verified_.insert(block_hash, ExecutionResult{
                                     .block = std::move(block),
                                     .state = std::move(processed.state),
                                     .receipts = std::move(processed.receipts),
                                     .duration = duration,
                                 });
    return true;
}

void BlockCoordinator::new_l2_block(const ExecutableL2Data& data, const BlsData& bls) {
    std::scoped_lock lock{mutex_};

    const Block head{store_.current_block()};
    const Block block{materialize_on_head(data, bls, head)};
    const evmc::bytes32 block_hash{block.header.hash()};

    if (auto cached{verified_.take(block_hash)}) {
        ensure_invariant(cached->state != nullptr, "BlockCoordinator: verified result without state");
        ROLL_DEBUG_M("Committing verified block", {"number", std::to_string(data.number), "hash", to_hex(block_hash, true)});
        write_head(block, cached->receipts, std::move(cached->state), cached->duration);
        verified_.clear();
        return;
    }

    if (const ValidationResult result{verify_block(block)}; result != ValidationResult::kOk) {
        ROLL_ERROR_M("failed to verify block", {"number", std::to_string(data.number),
                                                "result", std::string{protocol::to_string(result)}});
        throw L2Error{L2ErrorCode::kVerificationFailed,
                      "failed to verify block: " + std::string{protocol::to_string(result)}};
    }

    StopWatch sw{StopWatch::kStart};
    execution::api::ProcessedBlock processed;
    try {
        processed = executor_.process_block(block, head.header);
    } catch (const std::exception& e) {
        ROLL_ERROR_M("error processing block", {"number", std::to_string(data.number), "error", e.what()});
        throw L2Error{L2ErrorCode::kExecutionFailed, e.what()};
    }
    const auto duration{sw.since_start()};
    ensure(processed.state != nullptr, "BlockExecutor: processed block without post state");

    if (const ValidationResult result{verify_execution_roots(block, *processed.state, processed.receipts)};
        result != ValidationResult::kOk) {
        throw L2Error{L2ErrorCode::kVerificationFailed,
                      "execution roots mismatch: " + std::string{protocol::to_string(result)}};
    }

    write_head(block, processed.receipts, std::move(processed.state), duration);
    // The head moved, whatever is left refers to the previous parent
    verified_.clear();
}

size_t BlockCoordinator::verified_results_size() const {
    std::scoped_lock lock{mutex_};
    return verified_.size();
}

Block BlockCoordinator::materialize_on_head(const ExecutableL2Data& data, const BlsData& bls, const Block& head) const {
    const BlockNum expected_block_num{head.header.number + 1};
    if (data.number != expected_block_num) {
        ROLL_WARN_M("Cannot accept block with discontinuous block number",
                    {"expected", std::to_string(expected_block_num), "actual", std::to_string(data.number)});
        throw discontinuous_block_number(data.number, expected_block_num);
    }
    const evmc::bytes32 head_hash{head.header.hash()};
    if (data.parent_hash != head_hash) {
        ROLL_WARN_M("Wrong parent hash", {"expected", to_hex(head_hash, true), "actual", to_hex(data.parent_hash, true)});
        throw wrong_parent_hash(data.parent_hash, head_hash);
    }
    return materializer_.materialize(data, bls);
}

ValidationResult BlockCoordinator::verify_block(const Block& block) const {
    if (const ValidationResult result{engine_.verify_header(store_, block.header, /*seal_present=*/false)};
        result != ValidationResult::kOk) {
        return result;
    }
    if (!store_.config().is_valid_tx_count(block.transactions.size())) {
        return ValidationResult::kTooManyTransactions;
    }
    return ValidationResult::kOk;
}

void BlockCoordinator::write_head(const Block& block, const std::vector<Receipt>& receipts,
                                  std::unique_ptr<state::StateSnapshot> state, std::chrono::nanoseconds duration) {
    try {
        store_.write_state_and_set_head(block, receipts, std::move(state), duration);
    } catch (const std::exception& e) {
        ROLL_ERROR_M("Failed to write block", {"number", std::to_string(block.header.number), "error", e.what()});
        throw L2Error{L2ErrorCode::kStoreFailed, e.what()};
    }
    ROLL_INFO_M("Committed block", {"number", std::to_string(block.header.number),
                                    "txs", std::to_string(block.transactions.size()),
                                    "execution", StopWatch::format(duration)});
}

ValidationResult BlockCoordinator::verify_execution_roots(const Block& block, const state::StateSnapshot& state,
                                                          const std::vector<Receipt>& receipts) const {
    if (!settings_.verify_execution_roots) {
        return ValidationResult::kOk;
    }
    if (const evmc::bytes32 state_root{state.state_root()}; state_root != block.header.state_root) {
        ROLL_WARN_M("State root mismatch", {"number", std::to_string(block.header.number),
                                            "claimed", to_hex(block.header.state_root, true),
                                            "computed", to_hex(state_root, true)});
        return ValidationResult::kWrongStateRoot;
    }
    if (const evmc::bytes32 receipts_root{protocol::compute_receipts_root(receipts)};
        receipts_root != block.header.receipts_root) {
        ROLL_WARN_M("Receipts root mismatch", {"number", std::to_string(block.header.number),
                                               "claimed", to_hex(block.header.receipts_root, true),
                                               "computed", to_hex(receipts_root, true)});
        return ValidationResult::kWrongReceiptsRoot;
    }
    return ValidationResult::kOk;
}

}  // namespace rollnode::l2
