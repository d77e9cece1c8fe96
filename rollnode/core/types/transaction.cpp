// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <rollnode/core/common/util.hpp>
#include <rollnode/core/rlp/decode_vector.hpp>
#include <rollnode/core/rlp/encode_vector.hpp>
#include <rollnode/core/types/address.hpp>
#include <rollnode/core/types/evmc_bytes32.hpp>
#include <rollnode/core/types/y_parity_and_chain_id.hpp>

namespace rollnode {

// https://eips.ethereum.org/EIPS/eip-155
intx::uint256 Transaction::v() const { return y_parity_and_chain_id_to_v(odd_y_parity, chain_id); }

// https://eips.ethereum.org/EIPS/eip-155
bool Transaction::set_v(const intx::uint256& v) {
    const std::optional<YParityAndChainId> parity_and_id{v_to_y_parity_and_chain_id(v)};
    if (!parity_and_id) {
        return false;
    }
    odd_y_parity = parity_and_id->odd;
    chain_id = parity_and_id->chain_id;
    return true;
}

evmc::bytes32 Transaction::hash() const {
    Bytes rlp;
    rlp::encode(rlp, *this, /*wrap_eip2718_into_string=*/false);
    return to_bytes32(keccak256(rlp));
}

namespace rlp {

    static Header header(const AccessListEntry& e) {
        return {.list = true, .payload_length = length(e.account) + length(e.storage_keys)};
    }

    size_t length(const AccessListEntry& e) {
        const Header h{header(e)};
        return length_of_length(h.payload_length) + h.payload_length;
    }

    void encode(Bytes& to, const AccessListEntry& e) {
        encode_header(to, header(e));
        encode(to, e.account);
        encode(to, e.storage_keys);
    }

    DecodingResult decode(ByteView& from, AccessListEntry& to, Leftover mode) noexcept {
        return decode(from, mode, to.account.bytes, to.storage_keys);
    }

    static size_t to_length(const std::optional<evmc::address>& to) {
        return to ? kAddressLength + 1 : 1;
    }

    static void encode_to(Bytes& out, const std::optional<evmc::address>& to) {
        if (to) {
            encode(out, *to);
        } else {
            out.push_back(kEmptyStringCode);
        }
    }

    // Contract creation is encoded as an empty string in the recipient slot
    static DecodingResult decode_to(ByteView& from, std::optional<evmc::address>& to) noexcept {
        if (from.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }
        if (from[0] == kEmptyStringCode) {
            to = std::nullopt;
            from.remove_prefix(1);
            return {};
        }
        to = evmc::address{};
        return decode(from, to->bytes, Leftover::kAllow);
    }

    static Header header(const Transaction& txn) {
        Header h{.list = true};
        if (txn.type != TransactionType::kLegacy) {
            h.payload_length += length(txn.chain_id.value_or(0));
        }
        h.payload_length += length(txn.nonce);
        if (txn.type == TransactionType::kDynamicFee) {
            h.payload_length += length(txn.max_priority_fee_per_gas);
        }
        h.payload_length += length(txn.max_fee_per_gas);
        h.payload_length += length(txn.gas_limit);
        h.payload_length += to_length(txn.to);
        h.payload_length += length(txn.value);
        h.payload_length += length(txn.data);
        if (txn.type != TransactionType::kLegacy) {
            h.payload_length += length(txn.access_list);
            h.payload_length += length(txn.odd_y_parity);
        } else {
            h.payload_length += length(txn.v());
        }
        h.payload_length += length(txn.r);
        h.payload_length += length(txn.s);
        return h;
    }

    size_t length(const Transaction& txn, bool wrap_eip2718_into_string) {
        const Header h{header(txn)};
        const size_t rlp_len{length_of_length(h.payload_length) + h.payload_length};
        if (txn.type == TransactionType::kLegacy) {
            return rlp_len;
        }
        // type byte
        const size_t envelope_len{rlp_len + 1};
        return wrap_eip2718_into_string ? length_of_length(envelope_len) + envelope_len : envelope_len;
    }

    void encode(Bytes& to, const Transaction& txn, bool wrap_eip2718_into_string) {
        const Header h{header(txn)};
        if (txn.type == TransactionType::kLegacy) {
            encode_header(to, h);
            encode(to, txn.nonce);
            encode(to, txn.max_fee_per_gas);
            encode(to, txn.gas_limit);
            encode_to(to, txn.to);
            encode(to, txn.value);
            encode(to, txn.data);
            encode(to, txn.v());
            encode(to, txn.r);
            encode(to, txn.s);
            return;
        }

        if (wrap_eip2718_into_string) {
            const size_t rlp_len{length_of_length(h.payload_length) + h.payload_length};
            encode_header(to, {.list = false, .payload_length = rlp_len + 1});
        }
        to.push_back(static_cast<uint8_t>(txn.type));
        encode_header(to, h);
        encode(to, txn.chain_id.value_or(0));
        encode(to, txn.nonce);
        if (txn.type == TransactionType::kDynamicFee) {
            encode(to, txn.max_priority_fee_per_gas);
        }
        encode(to, txn.max_fee_per_gas);
        encode(to, txn.gas_limit);
        encode_to(to, txn.to);
        encode(to, txn.value);
        encode(to, txn.data);
        encode(to, txn.access_list);
        encode(to, txn.odd_y_parity);
        encode(to, txn.r);
        encode(to, txn.s);
    }

    static DecodingResult legacy_decode_items(ByteView& from, Transaction& to) noexcept {
        if (DecodingResult res{decode_items(from, to.nonce, to.max_fee_per_gas, to.gas_limit)}; !res) {
            return res;
        }
        to.max_priority_fee_per_gas = to.max_fee_per_gas;

        if (DecodingResult res{decode_to(from, to.to)}; !res) {
            return res;
        }

        intx::uint256 v;
        if (DecodingResult res{decode_items(from, to.value, to.data, v)}; !res) {
            return res;
        }
        if (!to.set_v(v)) {
            return tl::unexpected{DecodingError::kInvalidVInSignature};
        }

        return decode_items(from, to.r, to.s);
    }

    // Decodes the list following the type byte of an EIP-2718 envelope
    static DecodingResult eip2718_decode(ByteView& from, Transaction& to) noexcept {
        if (to.type != TransactionType::kAccessList && to.type != TransactionType::kDynamicFee) {
            return tl::unexpected{DecodingError::kUnsupportedTransactionType};
        }

        const auto h{decode_header(from)};
        if (!h) {
            return tl::unexpected{h.error()};
        }
        if (!h->list) {
            return tl::unexpected{DecodingError::kUnexpectedString};
        }
        const size_t leftover{from.size() - h->payload_length};

        intx::uint256 chain_id;
        if (DecodingResult res{decode_items(from, chain_id, to.nonce)}; !res) {
            return res;
        }
        to.chain_id = chain_id;

        if (to.type == TransactionType::kAccessList) {
            if (DecodingResult res{decode(from, to.max_fee_per_gas, Leftover::kAllow)}; !res) {
                return res;
            }
            to.max_priority_fee_per_gas = to.max_fee_per_gas;
        } else if (DecodingResult res{decode_items(from, to.max_priority_fee_per_gas, to.max_fee_per_gas)}; !res) {
            return res;
        }

        if (DecodingResult res{decode(from, to.gas_limit, Leftover::kAllow)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_to(from, to.to)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_items(from, to.value, to.data, to.access_list)}; !res) {
            return res;
        }
        if (DecodingResult res{decode_items(from, to.odd_y_parity, to.r, to.s)}; !res) {
            return res;
        }

        if (from.size() != leftover) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }
        return {};
    }

    DecodingResult decode_transaction(ByteView& from, Transaction& to, Eip2718Wrapping accepted_typed_txn_wrapping,
                                      Leftover mode) noexcept {
        to = Transaction{};

        if (from.empty()) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }

        if (0 < from[0] && from[0] < kEmptyStringCode) {  // Raw serialization of a typed transaction
            if (accepted_typed_txn_wrapping == Eip2718Wrapping::kString) {
                return tl::unexpected{DecodingError::kUnexpectedEip2718Serialization};
            }
            to.type = static_cast<TransactionType>(from[0]);
            from.remove_prefix(1);
            if (DecodingResult res{eip2718_decode(from, to)}; !res) {
                return res;
            }
            return check_leftover(from, mode);
        }

        const auto h{decode_header(from)};
        if (!h) {
            return tl::unexpected{h.error()};
        }

        if (h->list) {  // Legacy transaction
            to.type = TransactionType::kLegacy;
            const size_t leftover{from.size() - h->payload_length};
            if (mode != Leftover::kAllow && leftover) {
                return tl::unexpected{DecodingError::kInputTooLong};
            }
            if (DecodingResult res{legacy_decode_items(from, to)}; !res) {
                return res;
            }
            if (from.size() != leftover) {
                return tl::unexpected{DecodingError::kUnexpectedListElements};
            }
            return {};
        }

        // String-wrapped typed transaction
        if (accepted_typed_txn_wrapping == Eip2718Wrapping::kNone) {
            return tl::unexpected{DecodingError::kUnexpectedEip2718Serialization};
        }
        if (h->payload_length == 0) {
            return tl::unexpected{DecodingError::kInputTooShort};
        }

        to.type = static_cast<TransactionType>(from[0]);
        from.remove_prefix(1);

        ByteView eip2718_view{from.substr(0, h->payload_length - 1)};
        if (DecodingResult res{eip2718_decode(eip2718_view, to)}; !res) {
            return res;
        }
        if (!eip2718_view.empty()) {
            return tl::unexpected{DecodingError::kUnexpectedListElements};
        }

        from.remove_prefix(h->payload_length - 1);
        return check_leftover(from, mode);
    }

}  // namespace rlp

}  // namespace rollnode
