// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <rollnode/core/common/base.hpp>
#include <rollnode/core/common/bytes.hpp>
#include <rollnode/core/rlp/decode.hpp>
#include <rollnode/core/types/address.hpp>
#include <rollnode/core/types/evmc_bytes32.hpp>

namespace rollnode {

// EIP-2930: Optional access lists
struct AccessListEntry {
    evmc::address account{};
    std::vector<evmc::bytes32> storage_keys{};

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

// EIP-2718 transaction type
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
};

struct UnsignedTransaction {
    TransactionType type{TransactionType::kLegacy};

    std::optional<intx::uint256> chain_id{std::nullopt};  // nullopt means a pre-EIP-155 transaction

    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};  // EIP-1559
    intx::uint256 max_fee_per_gas{0};
    uint64_t gas_limit{0};
    std::optional<evmc::address> to{std::nullopt};
    intx::uint256 value{0};
    Bytes data{};

    std::vector<AccessListEntry> access_list{};  // EIP-2930

    friend bool operator==(const UnsignedTransaction&, const UnsignedTransaction&) = default;
};

// Signed transaction in the chain's standard binary envelope.
// Sender recovery is left to the executor.
class Transaction : public UnsignedTransaction {
  public:
    bool odd_y_parity{false};
    intx::uint256 r{0}, s{0};  // signature

    intx::uint256 v() const;  // EIP-155

    //! \brief Returns false if v is not acceptable (v != 27 && v != 28 && v < 35, see EIP-155)
    bool set_v(const intx::uint256& v);

    //! \brief Keccak of the canonical (unwrapped) envelope
    evmc::bytes32 hash() const;

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

namespace rlp {
    void encode(Bytes& to, const AccessListEntry&);
    size_t length(const AccessListEntry&);

    // According to EIP-2718, serialized transactions are prepended with 1 byte containing the type.
    // This is the form used by the transactions root and the control API. In block body RLP,
    // typed transactions are additionally wrapped into an RLP byte array (=string).
    void encode(Bytes& to, const Transaction& txn, bool wrap_eip2718_into_string = true);
    size_t length(const Transaction&, bool wrap_eip2718_into_string = true);

    DecodingResult decode(ByteView& from, AccessListEntry& to, Leftover mode = Leftover::kProhibit) noexcept;

    enum class Eip2718Wrapping {
        kNone,    // Serialized typed transactions must start with its type byte, e.g. 0x02
        kString,  // Serialized typed transactions must be additionally wrapped into an RLP string (=byte array)
        kBoth,    // Both options above are accepted
    };

    DecodingResult decode_transaction(ByteView& from, Transaction& to, Eip2718Wrapping accepted_typed_txn_wrapping,
                                      Leftover mode = Leftover::kProhibit) noexcept;

    inline DecodingResult decode(ByteView& from, Transaction& to, Leftover mode = Leftover::kProhibit) noexcept {
        return decode_transaction(from, to, Eip2718Wrapping::kString, mode);
    }
}  // namespace rlp

}  // namespace rollnode
