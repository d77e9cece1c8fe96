// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rollnode/core/protocol/chain_reader.hpp>
#include <rollnode/core/protocol/validation.hpp>
#include <rollnode/core/types/block.hpp>

namespace rollnode::protocol {

// Abstract consensus engine responsible for the sealing rules of the chain.
// Implementations live with the consensus client; the node only prepares and verifies headers through it.
class ConsensusEngine {
  public:
    virtual ~ConsensusEngine() = default;

    //! \brief Fills the engine specific header fields (e.g. difficulty, nonce) before the header is hashed.
    //! \param [in] chain: local chain view
    //! \param [in,out] header: header to prepare
    //! \throws std::runtime_error if the header cannot be prepared (e.g. unknown parent)
    virtual void prepare(const ChainReader& chain, BlockHeader& header) = 0;

    //! \brief See [YP] Section 4.3.4 "Block Header Validity", plus the engine seal rules.
    //! \param [in] seal_present: whether the seal fields must be verified as well
    virtual ValidationResult verify_header(const ChainReader& chain, const BlockHeader& header, bool seal_present) = 0;
};

}  // namespace rollnode::protocol
