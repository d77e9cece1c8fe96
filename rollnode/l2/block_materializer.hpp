// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <rollnode/core/protocol/chain_reader.hpp>
#include <rollnode/core/protocol/consensus_engine.hpp>
#include <rollnode/core/types/block.hpp>
#include <rollnode/core/types/bls_data.hpp>
#include <rollnode/l2/types.hpp>

namespace rollnode::l2 {

//! \brief Decodes EIP-2718 binary envelopes, typed transactions not wrapped into an RLP string
//! \throws L2Error with kInvalidTransaction naming the index of the first undecodable transaction
std::vector<Transaction> decode_transactions(const std::vector<Bytes>& encoded_transactions);

//! \brief Rebuilds a full block out of its wire descriptor.
//! The transactions root is derived from the decoded transactions, while state root, receipts root and
//! logs bloom are copied as claimed by the proposer: nothing here corroborates them.
class BlockMaterializer {
  public:
    BlockMaterializer(protocol::ConsensusEngine& engine, const protocol::ChainReader& chain)
        : engine_{engine}, chain_{chain} {}

    //! \param [in] data: block descriptor
    //! \param [in] bls: aggregate signature to attach to the header, ignored if empty
    //! \throws L2Error with kInvalidTransaction naming the index of the first undecodable transaction
    Block materialize(const ExecutableL2Data& data, const BlsData& bls = {}) const;

  private:
    protocol::ConsensusEngine& engine_;
    const protocol::ChainReader& chain_;
};

}  // namespace rollnode::l2
