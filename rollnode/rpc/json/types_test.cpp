// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <rollnode/core/common/util.hpp>

namespace rollnode::rpc {

using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;

TEST_CASE("convert zero uint256 to quantity", "[rollnode][rpc][to_quantity]") {
    intx::uint256 zero_u256{0};
    CHECK(to_quantity(zero_u256) == "0x0");
}

TEST_CASE("convert positive uint256 to quantity", "[rollnode][rpc][to_quantity]") {
    intx::uint256 positive_u256{100};
    CHECK(to_quantity(positive_u256) == "0x64");
}

TEST_CASE("convert uint64 to quantity", "[rollnode][rpc][to_quantity]") {
    CHECK(to_quantity(uint64_t{0}) == "0x0");
    CHECK(to_quantity(uint64_t{1}) == "0x1");
    CHECK(to_quantity(uint64_t{0x1c9c380}) == "0x1c9c380");
    CHECK(to_quantity(uint64_t{0xffffffffffffffff}) == "0xffffffffffffffff");
}

TEST_CASE("convert bytes to quantity", "[rollnode][rpc][to_quantity]") {
    CHECK(to_quantity(*from_hex("0x00000a")) == "0xa");
    CHECK(to_quantity(*from_hex("0x0000")) == "0x0");
    CHECK(to_quantity(ByteView{}) == "0x0");
}

TEST_CASE("parse hex quantity", "[rollnode][rpc][from_quantity]") {
    CHECK(from_quantity("0x0") == 0);
    CHECK(from_quantity("0x1c9c380") == 0x1c9c380);
    CHECK(from_quantity("0xFFFFFFFFFFFFFFFF") == 0xffffffffffffffff);

    CHECK_THROWS_AS(from_quantity("12"), std::invalid_argument);
    CHECK_THROWS_AS(from_quantity("0x"), std::invalid_argument);
    CHECK_THROWS_AS(from_quantity("0x1g"), std::invalid_argument);
    CHECK_THROWS_AS(from_quantity("0x10000000000000000"), std::invalid_argument);
}

TEST_CASE("parse hex bytes", "[rollnode][rpc][bytes_from_hex]") {
    CHECK(bytes_from_hex("0x").empty());
    CHECK(bytes_from_hex("0x0102") == *from_hex("0102"));
    CHECK_THROWS_AS(bytes_from_hex("0102"), std::invalid_argument);
    CHECK_THROWS_AS(bytes_from_hex("0xzz"), std::invalid_argument);
    CHECK_THROWS_AS(bytes_from_hex("0x1"), std::invalid_argument);
    CHECK_THROWS_AS(bytes_from_hex("0x123"), std::invalid_argument);
}

TEST_CASE("parse logs bloom", "[rollnode][rpc][bloom_from_hex]") {
    const std::string zero_bloom{"0x" + std::string(kBloomByteLength * 2, '0')};
    CHECK(bloom_from_hex(zero_bloom) == Bloom{});
    CHECK_THROWS_AS(bloom_from_hex("0x00"), std::invalid_argument);
}

TEST_CASE("serialize address and hash", "[rollnode][rpc][to_json]") {
    CHECK(nlohmann::json(0xa94f5374fce5edbc8e2a8697c15331677e6ebf0b_address) == "0xa94f5374fce5edbc8e2a8697c15331677e6ebf0b");
    CHECK(nlohmann::json(0x3b8fb240d288781d4aac94d3fd16809ee413bc99294a085798a589dae51ddd4a_bytes32) ==
          "0x3b8fb240d288781d4aac94d3fd16809ee413bc99294a085798a589dae51ddd4a");
}

TEST_CASE("deserialize address and hash", "[rollnode][rpc][from_json]") {
    SECTION("well formed") {
        const auto address = nlohmann::json("0xa94f5374fce5edbc8e2a8697c15331677e6ebf0b").get<evmc::address>();
        CHECK(address == 0xa94f5374fce5edbc8e2a8697c15331677e6ebf0b_address);
        const auto hash = nlohmann::json("0x3b8fb240d288781d4aac94d3fd16809ee413bc99294a085798a589dae51ddd4a").get<evmc::bytes32>();
        CHECK(hash == 0x3b8fb240d288781d4aac94d3fd16809ee413bc99294a085798a589dae51ddd4a_bytes32);
    }
    SECTION("wrong length") {
        CHECK_THROWS_AS(nlohmann::json("0xa94f5374").get<evmc::address>(), std::invalid_argument);
        CHECK_THROWS_AS(nlohmann::json("0x3b8fb240").get<evmc::bytes32>(), std::invalid_argument);
    }
    SECTION("not a string") {
        CHECK_THROWS_AS(nlohmann::json(42).get<evmc::address>(), nlohmann::json::type_error);
    }
}

TEST_CASE("deserialize uint256", "[rollnode][rpc][from_json]") {
    CHECK(nlohmann::json("0x3b9aca00").get<intx::uint256>() == 1'000'000'000);
}

TEST_CASE("make json content", "[rollnode][rpc][make_json_content]") {
    const nlohmann::json request = R"({"jsonrpc":"2.0","id":3,"method":"engine_newL2Block","params":[]})"_json;
    CHECK(make_json_content(request) == R"({"jsonrpc":"2.0","id":3,"result":null})"_json);
    CHECK(make_json_content(request, {{"valid", true}}) == R"({"jsonrpc":"2.0","id":3,"result":{"valid":true}})"_json);
}

TEST_CASE("make json error", "[rollnode][rpc][make_json_error]") {
    const nlohmann::json request = R"({"jsonrpc":"2.0","method":"engine_newL2Block","params":[]})"_json;
    CHECK(make_json_error(request, -32000, "boom") ==
          R"({"jsonrpc":"2.0","id":null,"error":{"code":-32000,"message":"boom"}})"_json);
}

}  // namespace rollnode::rpc
