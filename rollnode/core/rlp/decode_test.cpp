// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "decode.hpp"

#include <catch2/catch_test_macros.hpp>

#include <rollnode/core/common/util.hpp>

#include "decode_vector.hpp"

namespace rollnode::rlp {

template <class T>
static T decode_success(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    T res{};
    REQUIRE(decode(view, res));
    return res;
}

template <class T>
static DecodingError decode_failure(std::string_view hex) {
    Bytes bytes{*from_hex(hex)};
    ByteView view{bytes};
    T x{};
    DecodingResult res{decode(view, x)};
    REQUIRE(!res);
    return res.error();
}

TEST_CASE("RLP string decoding", "[rollnode][core][rlp]") {
    CHECK(to_hex(decode_success<Bytes>("00")) == "00");
    CHECK(to_hex(decode_success<Bytes>("83646f67")) == "646f67");
    CHECK(decode_success<Bytes>("80").empty());
    CHECK(decode_failure<Bytes>("83646f67aa") == DecodingError::kInputTooLong);
    CHECK(decode_failure<Bytes>("83646f") == DecodingError::kInputTooShort);
    CHECK(decode_failure<Bytes>("C0") == DecodingError::kUnexpectedList);
}

TEST_CASE("RLP integer decoding", "[rollnode][core][rlp]") {
    CHECK(decode_success<uint64_t>("09") == 9);
    CHECK(decode_success<uint64_t>("80") == 0);
    CHECK(decode_success<uint64_t>("820505") == 0x0505);
    CHECK(decode_success<intx::uint256>("8AFFFFFFFFFFFFFFFFFF7C") ==
          intx::from_string<intx::uint256>("0xFFFFFFFFFFFFFFFFFF7C"));

    CHECK(decode_failure<uint64_t>("00") == DecodingError::kLeadingZero);
    CHECK(decode_failure<uint64_t>("8105") == DecodingError::kNonCanonicalSize);
    CHECK(decode_failure<uint64_t>("B8020004") == DecodingError::kNonCanonicalSize);
    CHECK(decode_failure<uint64_t>("8AFFFFFFFFFFFFFFFFFF7C") == DecodingError::kOverflow);
}

TEST_CASE("RLP list decoding", "[rollnode][core][rlp]") {
    CHECK(decode_success<std::vector<uint64_t>>("C0").empty());
    CHECK(decode_success<std::vector<uint64_t>>("C883BBCCB583FFC0B5") == std::vector<uint64_t>{0xBBCCB5, 0xFFC0B5});
    CHECK(decode_failure<std::vector<uint64_t>>("C883BBCCB583FFC0B5aa") == DecodingError::kInputTooLong);
    CHECK(decode_failure<std::vector<uint64_t>>("83BBCCB5") == DecodingError::kUnexpectedString);

    SECTION("fixed field list") {
        Bytes encoded;
        encode(encoded, uint64_t{7}, Bytes{0xca, 0xfe});
        ByteView view{encoded};
        uint64_t a{0};
        Bytes b;
        REQUIRE(decode(view, Leftover::kProhibit, a, b));
        CHECK(a == 7);
        CHECK(b == Bytes{0xca, 0xfe});

        ByteView short_view{encoded};
        uint64_t c{0};
        CHECK(decode(short_view, Leftover::kProhibit, a, b, c).error() == DecodingError::kInputTooShort);
    }
}

TEST_CASE("RLP encoding", "[rollnode][core][rlp]") {
    Bytes out;
    encode(out, ByteView{});
    CHECK(to_hex(out) == "80");

    out.clear();
    encode(out, Bytes{0x7f});
    CHECK(to_hex(out) == "7f");

    out.clear();
    encode(out, uint64_t{1024});
    CHECK(to_hex(out) == "820400");
    CHECK(length(uint64_t{1024}) == 3);

    out.clear();
    const Bytes long_string(56, 0xaa);
    encode(out, long_string);
    CHECK(out.size() == 58);
    CHECK(out[0] == 0xb8);
    CHECK(out[1] == 56);
    CHECK(length(ByteView{long_string}) == 58);
}

}  // namespace rollnode::rlp
