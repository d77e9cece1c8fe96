// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <gmock/gmock.h>

#include <rollnode/core/protocol/consensus_engine.hpp>
#include <rollnode/execution/api/block_executor.hpp>
#include <rollnode/execution/api/body_validator.hpp>

namespace rollnode::l2::test_util {

class MockConsensusEngine : public protocol::ConsensusEngine {
  public:
    MOCK_METHOD((void), prepare, (const protocol::ChainReader&, BlockHeader&), (override));
    MOCK_METHOD((ValidationResult), verify_header, (const protocol::ChainReader&, const BlockHeader&, bool), (override));
};

class MockBlockExecutor : public execution::api::BlockExecutor {
  public:
    MOCK_METHOD((execution::api::SealingBlock), build_sealing_block,
                (const evmc::bytes32&, BlockTime, const std::vector<Transaction>&), (override));
    MOCK_METHOD((execution::api::ProcessedBlock), process_block, (const Block&, const BlockHeader&), (override));
};

class MockBodyValidator : public execution::api::BodyValidator {
  public:
    MOCK_METHOD((ValidationResult), validate_body, (const Block&), (override));
};

}  // namespace rollnode::l2::test_util
