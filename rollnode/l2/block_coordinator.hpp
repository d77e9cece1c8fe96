// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <rollnode/core/protocol/consensus_engine.hpp>
#include <rollnode/core/types/bls_data.hpp>
#include <rollnode/execution/api/block_executor.hpp>
#include <rollnode/execution/api/body_validator.hpp>
#include <rollnode/execution/api/chain_store.hpp>
#include <rollnode/l2/block_materializer.hpp>
#include <rollnode/l2/types.hpp>
#include <rollnode/l2/verified_results.hpp>

namespace rollnode::l2 {

struct CoordinatorSettings {
    //! Compare state and receipts roots computed by local execution with the ones claimed by the descriptor
    bool verify_execution_roots{false};
    //! Cache size multiple at which a warning is logged, zero disables it
    size_t verified_results_warn_threshold{VerifiedResults::kDefaultWarnThreshold};
};

//! \brief Orchestrates block production and commitment on behalf of the sequencer.
//! Every operation runs under a single coordinator-wide lock: the head read at the start of a call
//! cannot move before the call ends and the cache clear on commit never races an insert.
class BlockCoordinator {
  public:
    BlockCoordinator(protocol::ConsensusEngine& engine,
                     execution::api::BlockExecutor& executor,
                     execution::api::ChainStore& store,
                     execution::api::BodyValidator& body_validator,
                     CoordinatorSettings settings = {});

    BlockCoordinator(const BlockCoordinator&) = delete;
    BlockCoordinator& operator=(const BlockCoordinator&) = delete;

    //! \brief Builds and executes a candidate block on top of the current head
    //! \return the candidate descriptor or std::nullopt if the executor produced a block with no transactions
    //! \throws L2Error on discontinuous number, undecodable transaction or executor failure
    std::optional<ExecutableL2Data> assemble_l2_block(const AssembleL2BlockParams& params);

    //! \brief Checks a block built elsewhere, executing it when not already known
    //! \return whether the block is valid
    //! \throws L2Error only when the descriptor does not extend the head or carries undecodable transactions
    bool validate_l2_block(const ExecutableL2Data& data);

    //! \brief Makes the block the new canonical head, reusing a previous execution when available
    //! \throws L2Error on any failure, the head being left untouched
    void new_l2_block(const ExecutableL2Data& data, const BlsData& bls);

    //! \brief Number of execution results waiting for a commit
    size_t verified_results_size() const;

  private:
    //! Checks the descriptor extends the head and rebuilds the block from it
    Block materialize_on_head(const ExecutableL2Data& data, const BlsData& bls, const Block& head) const;

    //! Engine header rules plus the chain transaction count policy
    ValidationResult verify_block(const Block& block) const;

    //! Writes the post state and moves the head, store failures surface as kStoreFailed
    void write_head(const Block& block, const std::vector<Receipt>& receipts,
                    std::unique_ptr<state::StateSnapshot> state, std::chrono::nanoseconds duration);

    //! Compares the locally computed roots with the claimed ones, when enabled
    ValidationResult verify_execution_roots(const Block& block, const state::StateSnapshot& state,
                                            const std::vector<Receipt>& receipts) const;

    protocol::ConsensusEngine& engine_;
    execution::api::BlockExecutor& executor_;
    execution::api::ChainStore& store_;
    execution::api::BodyValidator& body_validator_;
    CoordinatorSettings settings_;
    BlockMaterializer materializer_;

    mutable std::mutex mutex_;
    VerifiedResults verified_;
};

}  // namespace rollnode::l2
