// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "l2_block.hpp"

#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>
#include <evmc/evmc.hpp>
#include <nlohmann/json.hpp>

#include <rollnode/core/common/util.hpp>
#include <rollnode/rpc/json/types.hpp>

namespace rollnode::l2 {

using evmc::literals::operator""_address, evmc::literals::operator""_bytes32;

static const std::string kZeroBloom{"0x" + std::string(kBloomByteLength * 2, '0')};

static ExecutableL2Data sample_data() {
    return ExecutableL2Data{
        .parent_hash = 0x3b8fb240d288781d4aac94d3fd16809ee413bc99294a085798a589dae51ddd4a_bytes32,
        .number = 0x1,
        .miner = 0xa94f5374fce5edbc8e2a8697c15331677e6ebf0b_address,
        .timestamp = 0x5,
        .gas_limit = 0x1c9c380,
        .base_fee = 0x7,
        .extra_data = *from_hex("0x0102"),
        .transactions = {*from_hex("0xf92ebdeab45d368f6354e8c5a8ac586c")},
        .state_root = 0xca3149fa9e37db08d1cd49c9061db1002ef1cd58db2210f2115c8c989b2bdf45_bytes32,
        .gas_used = 0x5208,
        .receipts_root = 0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421_bytes32,
    };
}

TEST_CASE("serialize ExecutableL2Data", "[rollnode][rpc][json]") {
    const nlohmann::json expected{
        {"parentHash", "0x3b8fb240d288781d4aac94d3fd16809ee413bc99294a085798a589dae51ddd4a"},
        {"number", "0x1"},
        {"miner", "0xa94f5374fce5edbc8e2a8697c15331677e6ebf0b"},
        {"timestamp", "0x5"},
        {"gasLimit", "0x1c9c380"},
        {"baseFee", "0x7"},
        {"extraData", "0x0102"},
        {"transactions", nlohmann::json::array({"0xf92ebdeab45d368f6354e8c5a8ac586c"})},
        {"stateRoot", "0xca3149fa9e37db08d1cd49c9061db1002ef1cd58db2210f2115c8c989b2bdf45"},
        {"gasUsed", "0x5208"},
        {"receiptsRoot", "0x56e81f171bcc55a6ff8345e692c0f86e5b48e01b996cadc001622fb5e363b421"},
        {"logsBloom", kZeroBloom},
    };
    CHECK(nlohmann::json(sample_data()) == expected);

    SECTION("no base fee") {
        auto data{sample_data()};
        data.base_fee = std::nullopt;
        CHECK_FALSE(nlohmann::json(data).contains("baseFee"));
    }
}

TEST_CASE("deserialize ExecutableL2Data", "[rollnode][rpc][json]") {
    SECTION("serialized form reads back") {
        const auto data{sample_data()};
        CHECK(nlohmann::json(data).get<ExecutableL2Data>() == data);
    }

    SECTION("optional fields may be absent or null") {
        nlohmann::json json = sample_data();
        json.erase("extraData");
        json["baseFee"] = nullptr;
        json["transactions"] = nullptr;
        const auto data{json.get<ExecutableL2Data>()};
        CHECK_FALSE(data.base_fee);
        CHECK(data.extra_data.empty());
        CHECK(data.transactions.empty());
    }

    SECTION("transactions may be absent") {
        nlohmann::json json = sample_data();
        json.erase("transactions");
        CHECK(json.get<ExecutableL2Data>().transactions.empty());
    }

    SECTION("odd length transaction") {
        nlohmann::json json = sample_data();
        json["transactions"] = nlohmann::json::array({"0x123"});
        CHECK_THROWS_AS(json.get<ExecutableL2Data>(), std::invalid_argument);
    }

    SECTION("missing required field") {
        nlohmann::json json = sample_data();
        json.erase("stateRoot");
        CHECK_THROWS_AS(json.get<ExecutableL2Data>(), nlohmann::json::out_of_range);
    }

    SECTION("malformed quantity") {
        nlohmann::json json = sample_data();
        json["number"] = "12";
        CHECK_THROWS_AS(json.get<ExecutableL2Data>(), std::invalid_argument);
    }

    SECTION("malformed transaction") {
        nlohmann::json json = sample_data();
        json["transactions"] = nlohmann::json::array({"0xzz"});
        CHECK_THROWS_AS(json.get<ExecutableL2Data>(), std::invalid_argument);
    }

    SECTION("short logs bloom") {
        nlohmann::json json = sample_data();
        json["logsBloom"] = "0x00";
        CHECK_THROWS_AS(json.get<ExecutableL2Data>(), std::invalid_argument);
    }
}

TEST_CASE("deserialize AssembleL2BlockParams", "[rollnode][rpc][json]") {
    const auto params = R"({"number":"0x2a","transactions":["0x01","0x0203"]})"_json.get<AssembleL2BlockParams>();
    CHECK(params.number == 42);
    REQUIRE(params.transactions.size() == 2);
    CHECK(params.transactions[1] == *from_hex("0x0203"));
    CHECK(nlohmann::json(params) == R"({"number":"0x2a","transactions":["0x01","0x0203"]})"_json);
}

TEST_CASE("BlsData json", "[rollnode][rpc][json]") {
    SECTION("signers and signature") {
        const auto bls = R"({"signers":["0x01","0x02"],"signature":"0xabcd"})"_json.get<BlsData>();
        CHECK(bls.signers.size() == 2);
        CHECK(bls.signature == *from_hex("0xabcd"));
        CHECK(nlohmann::json(bls) == R"({"signers":["0x01","0x02"],"signature":"0xabcd"})"_json);
    }
    SECTION("null is empty") {
        CHECK(nlohmann::json(nullptr).get<BlsData>().empty());
        CHECK(R"({})"_json.get<BlsData>().empty());
    }
    SECTION("anything else is rejected") {
        CHECK_THROWS_AS(nlohmann::json("0xdead").get<BlsData>(), std::invalid_argument);
        CHECK_THROWS_AS(R"(["0x01"])"_json.get<BlsData>(), std::invalid_argument);
        CHECK_THROWS_AS(nlohmann::json(42).get<BlsData>(), std::invalid_argument);
    }
}

}  // namespace rollnode::l2
