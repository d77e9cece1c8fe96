// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>
#include <vector>

#include <evmc/evmc.hpp>

#include <rollnode/core/chain/config.hpp>
#include <rollnode/core/types/block.hpp>
#include <rollnode/core/types/receipt.hpp>

namespace rollnode {

// Classification of invalid blocks.
enum class [[nodiscard]] ValidationResult {
    kOk,  // All checks passed

    kFutureBlock,  // Block has a timestamp in the future

    // [YP] Section 4.3.2 "Holistic Validity", Eq (31)
    kWrongStateRoot,         // wrong Hr
    kWrongOmmersHash,        // wrong Ho
    kWrongTransactionsRoot,  // wrong Ht
    kWrongReceiptsRoot,      // wrong He
    kWrongLogsBloom,         // wrong Hb

    // [YP] Section 4.3.4 "Block Header Validity", Eq (50)
    kUnknownParent,      // P(H) = ∅ ∨ Hi ≠ P(H)Hi + 1
    kWrongDifficulty,    // Hd ≠ D(H)
    kGasAboveLimit,      // Hg > Hl
    kInvalidGasLimit,    // |Hl-P(H)Hl|≥P(H)Hl/1024 ∨ Hl<5000
    kInvalidTimestamp,   // Hs ≤ P(H)Hs
    kExtraDataTooLong,   // ‖Hx‖ > 32
    kInvalidSeal,        // Nonce or mix_hash
    kMissingField,       // e.g. missing base fee after London
    kFieldBeforeFork,    // e.g. base fee present before London

    // EIP-1559: Fee market change for ETH 1.0 chain
    kWrongBaseFee,

    // Block body
    kTooManyOmmers,
    kTooManyTransactions,  // Chain transaction count policy
    kUnsupportedTransactionType,
    kWrongBlockGas,
    kKnownBlock,  // Block is already part of the chain
};

namespace protocol {

    std::string_view to_string(ValidationResult result);

    //! \brief Calculate the transaction root of a block body
    evmc::bytes32 compute_transaction_root(const BlockBody& body);

    evmc::bytes32 compute_receipts_root(const std::vector<Receipt>& receipts);

    //! \brief Calculate the hash of ommers of a block body
    evmc::bytes32 compute_ommers_hash(const BlockBody& body);

    //! \brief Structural validation of a block body against its own header, no state access
    //! \remarks Blocks produced by the sequencer carry no ommers
    ValidationResult pre_validate_block_body(const Block& block, const ChainConfig& config);

}  // namespace protocol

}  // namespace rollnode
