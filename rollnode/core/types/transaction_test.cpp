// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rollnode/core/common/util.hpp>

namespace rollnode {

using namespace evmc::literals;

// https://eips.ethereum.org/EIPS/eip-155#example
static constexpr std::string_view kEip155SignedTx{
    "f86c098504a817c800825208943535353535353535353535353535353535353535880de0b6b3a76400008025a028ef61340bd9"
    "39bc2195fe537567866003e1a15d3c71ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b"
    "297fb1966a3b6d83"};

TEST_CASE("Legacy transaction decoding", "[rollnode][core][types][transaction]") {
    const Bytes encoded{*from_hex(kEip155SignedTx)};
    ByteView view{encoded};
    Transaction txn;
    REQUIRE(rlp::decode_transaction(view, txn, rlp::Eip2718Wrapping::kNone));

    CHECK(txn.type == TransactionType::kLegacy);
    CHECK(txn.nonce == 9);
    CHECK(txn.max_fee_per_gas == intx::uint256{20 * kGiga});
    CHECK(txn.gas_limit == 21'000);
    CHECK(txn.to == 0x3535353535353535353535353535353535353535_address);
    CHECK(txn.value == intx::uint256{1'000'000'000'000'000'000u});
    CHECK(txn.data.empty());
    CHECK(txn.chain_id == intx::uint256{1});
    CHECK(!txn.odd_y_parity);
    CHECK(txn.v() == intx::uint256{37});

    Bytes reencoded;
    rlp::encode(reencoded, txn, /*wrap_eip2718_into_string=*/false);
    CHECK(reencoded == encoded);
    CHECK(txn.hash() == to_bytes32(keccak256(encoded)));
}

TEST_CASE("Typed transaction envelopes", "[rollnode][core][types][transaction]") {
    Transaction txn;
    txn.type = TransactionType::kDynamicFee;
    txn.chain_id = 2818;
    txn.nonce = 3;
    txn.max_priority_fee_per_gas = 1;
    txn.max_fee_per_gas = 2 * kGiga;
    txn.gas_limit = 50'000;
    txn.to = 0x5300000000000000000000000000000000000002_address;
    txn.data = *from_hex("a9059cbb");
    txn.access_list = {{0x5300000000000000000000000000000000000002_address,
                        {0x0000000000000000000000000000000000000000000000000000000000000001_bytes32}}};
    txn.odd_y_parity = true;
    txn.r = 1;
    txn.s = 2;

    Bytes raw;
    rlp::encode(raw, txn, /*wrap_eip2718_into_string=*/false);
    REQUIRE(raw[0] == 0x02);
    CHECK(raw.size() == rlp::length(txn, /*wrap_eip2718_into_string=*/false));

    SECTION("raw envelope") {
        ByteView view{raw};
        Transaction decoded;
        REQUIRE(rlp::decode_transaction(view, decoded, rlp::Eip2718Wrapping::kNone));
        CHECK(decoded == txn);
        CHECK(decoded.hash() == txn.hash());
    }

    SECTION("string-wrapped envelope is rejected where only raw is accepted") {
        Bytes wrapped;
        rlp::encode(wrapped, txn, /*wrap_eip2718_into_string=*/true);
        ByteView view{wrapped};
        Transaction decoded;
        const DecodingResult res{rlp::decode_transaction(view, decoded, rlp::Eip2718Wrapping::kNone)};
        REQUIRE(!res);
        CHECK(res.error() == DecodingError::kUnexpectedEip2718Serialization);
    }

    SECTION("trailing bytes") {
        Bytes padded{raw};
        padded.push_back(0x00);
        ByteView view{padded};
        Transaction decoded;
        CHECK(rlp::decode_transaction(view, decoded, rlp::Eip2718Wrapping::kNone).error() ==
              DecodingError::kInputTooLong);
    }
}

TEST_CASE("Malformed transaction envelopes", "[rollnode][core][types][transaction]") {
    Transaction txn;

    SECTION("unknown type") {
        const Bytes blob_tx{*from_hex("03c0")};
        ByteView view{blob_tx};
        CHECK(rlp::decode_transaction(view, txn, rlp::Eip2718Wrapping::kNone).error() ==
              DecodingError::kUnsupportedTransactionType);
    }

    SECTION("empty input") {
        ByteView view{};
        CHECK(rlp::decode_transaction(view, txn, rlp::Eip2718Wrapping::kBoth).error() ==
              DecodingError::kInputTooShort);
    }

    SECTION("invalid v") {
        // nonce 0, gas price 0, gas 0, no recipient, value 0, no data, v 30, r 1, s 1
        const Bytes encoded{*from_hex("c9808080808080" "1e0101")};
        ByteView view{encoded};
        CHECK(rlp::decode_transaction(view, txn, rlp::Eip2718Wrapping::kNone).error() ==
              DecodingError::kInvalidVInSignature);
    }
}

}  // namespace rollnode
