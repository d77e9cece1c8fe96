// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "l2_engine_api.hpp"

#include <stdexcept>
#include <string>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_exception.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>

#include <rollnode/execution/body_validator.hpp>
#include <rollnode/infra/test_util/log.hpp>
#include <rollnode/l2/block_materializer.hpp>
#include <rollnode/l2/test_util/fake_chain.hpp>
#include <rollnode/rpc/json/l2_block.hpp>
#include <rollnode/rpc/json/types.hpp>
#include <rollnode/rpc/protocol/errors.hpp>

namespace rollnode::rpc::commands {

using namespace l2::test_util;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::Message;

class L2EngineRpcApiForTest : public L2EngineRpcApi {
  public:
    using L2EngineRpcApi::L2EngineRpcApi;

    using L2EngineRpcApi::handle_engine_assemble_l2_block;
    using L2EngineRpcApi::handle_engine_new_l2_block;
    using L2EngineRpcApi::handle_engine_validate_l2_block;
};

struct L2EngineRpcApiTest {
    //! Descriptor of a block built by another node on top of the current head
    l2::ExecutableL2Data propose(size_t txn_count, uint64_t first_nonce = 0) {
        FakeBlockExecutor proposer{engine, store};
        const BlockHeader head{store.current_header()};
        auto sealing{proposer.build_sealing_block(head.hash(), head.timestamp + 2,
                                                  l2::decode_transactions(sample_transactions(txn_count, first_nonce)))};
        return l2::make_executable_l2_data(sealing.block);
    }

    static nlohmann::json make_request(const std::string& method, nlohmann::json params) {
        return {{"jsonrpc", "2.0"}, {"id", 1}, {"method", method}, {"params", std::move(params)}};
    }

    rollnode::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    FakeChainStore store;
    FakeConsensusEngine engine;
    FakeBlockExecutor executor{engine, store};
    execution::ChainBodyValidator body_validator{store.config()};
    l2::BlockCoordinator coordinator{engine, executor, store, body_validator};
    L2EngineRpcApiForTest api{coordinator, store.config()};
};

TEST_CASE("L2EngineRpcApi: construction requires terminal total difficulty", "[rollnode][rpc][engine_api]") {
    rollnode::test_util::SetLogVerbosityGuard log_guard{log::Level::kNone};
    ChainConfig config{test_chain_config()};
    config.terminal_total_difficulty = std::nullopt;
    FakeChainStore store{config};
    FakeConsensusEngine engine;
    FakeBlockExecutor executor{engine, store};
    execution::ChainBodyValidator body_validator{config};
    l2::BlockCoordinator coordinator{engine, executor, store, body_validator};

    CHECK_THROWS_MATCHES(L2EngineRpcApi(coordinator, config), std::invalid_argument,
                         Message("l2 engine started without valid terminal total difficulty"));
}

TEST_CASE_METHOD(L2EngineRpcApiTest, "L2EngineRpcApi: dispatch", "[rollnode][rpc][engine_api]") {
    SECTION("unknown method") {
        const auto reply{api.handle_request(make_request("engine_newPayloadV1", nlohmann::json::array()))};
        CHECK(reply["id"] == 1);
        CHECK(reply["error"]["code"] == kMethodNotFound);
        CHECK_THAT(reply["error"]["message"].get<std::string>(), ContainsSubstring("engine_newPayloadV1"));
    }
    SECTION("missing method") {
        const auto reply{api.handle_request(R"({"jsonrpc":"2.0","id":7,"params":[]})"_json)};
        CHECK(reply["id"] == 7);
        CHECK(reply["error"]["code"] == kInvalidRequest);
    }
    SECTION("missing params") {
        const auto reply{api.handle_request(R"({"jsonrpc":"2.0","id":7,"method":"engine_validateL2Block"})"_json)};
        CHECK(reply["error"]["code"] == kInvalidParams);
    }
    SECTION("known method") {
        const auto reply{api.handle_request(make_request("engine_validateL2Block", nlohmann::json::array({propose(1)})))};
        CHECK(reply == R"({"jsonrpc":"2.0","id":1,"result":{"valid":true}})"_json);
    }
}

TEST_CASE_METHOD(L2EngineRpcApiTest, "L2EngineRpcApi: engine_assembleL2Block", "[rollnode][rpc][engine_api]") {
    SECTION("candidate descriptor") {
        const auto txs{sample_transactions(2)};
        const l2::AssembleL2BlockParams params{.number = 1, .transactions = txs};
        nlohmann::json reply;
        api.handle_engine_assemble_l2_block(make_request("engine_assembleL2Block", nlohmann::json::array({params})), reply);
        REQUIRE(reply.contains("result"));
        const auto data{reply["result"].get<l2::ExecutableL2Data>()};
        CHECK(data.number == 1);
        CHECK(data.transactions == txs);
        CHECK(data.parent_hash == store.current_header().hash());
    }
    SECTION("no transactions gives null result") {
        nlohmann::json reply;
        api.handle_engine_assemble_l2_block(
            make_request("engine_assembleL2Block", R"([{"number":"0x1","transactions":[]}])"_json), reply);
        CHECK(reply == R"({"jsonrpc":"2.0","id":1,"result":null})"_json);
    }
    SECTION("discontinuous number") {
        nlohmann::json reply;
        api.handle_engine_assemble_l2_block(
            make_request("engine_assembleL2Block", R"([{"number":"0x5","transactions":[]}])"_json), reply);
        CHECK(reply["error"]["code"] == kServerError);
        CHECK(reply["error"]["message"] == "cannot assemble block with discontinuous block number 5, expected number is 1");
    }
    SECTION("undecodable transaction") {
        nlohmann::json reply;
        api.handle_engine_assemble_l2_block(
            make_request("engine_assembleL2Block", R"([{"number":"0x1","transactions":["0x01"]}])"_json), reply);
        CHECK(reply["error"]["code"] == kServerError);
        CHECK_THAT(reply["error"]["message"].get<std::string>(), ContainsSubstring("transaction 0 is not valid"));
    }
    SECTION("malformed params") {
        nlohmann::json reply;
        api.handle_engine_assemble_l2_block(make_request("engine_assembleL2Block", R"([{"number":1}])"_json), reply);
        CHECK(reply["error"]["code"] == kInvalidParams);
    }
    SECTION("wrong params count") {
        nlohmann::json reply;
        api.handle_engine_assemble_l2_block(make_request("engine_assembleL2Block", nlohmann::json::array()), reply);
        CHECK(reply["error"]["code"] == kInvalidParams);
    }
}

TEST_CASE_METHOD(L2EngineRpcApiTest, "L2EngineRpcApi: engine_validateL2Block", "[rollnode][rpc][engine_api]") {
    SECTION("valid proposal") {
        nlohmann::json reply;
        api.handle_engine_validate_l2_block(make_request("engine_validateL2Block", nlohmann::json::array({propose(2)})), reply);
        CHECK(reply["result"] == R"({"valid":true})"_json);
        CHECK(coordinator.verified_results_size() == 1);
    }
    SECTION("engine rejection is a negative outcome") {
        auto data{propose(1)};
        data.extra_data = Bytes(FakeConsensusEngine::kMaxExtraDataBytes + 1, 0xff);
        nlohmann::json reply;
        api.handle_engine_validate_l2_block(make_request("engine_validateL2Block", nlohmann::json::array({data})), reply);
        CHECK(reply["result"] == R"({"valid":false})"_json);
    }
    SECTION("wrong parent hash is an error") {
        auto data{propose(1)};
        data.parent_hash = evmc::bytes32{};
        nlohmann::json reply;
        api.handle_engine_validate_l2_block(make_request("engine_validateL2Block", nlohmann::json::array({data})), reply);
        CHECK(reply["error"]["code"] == kServerError);
        CHECK_THAT(reply["error"]["message"].get<std::string>(), ContainsSubstring("wrong parent hash"));
    }
    SECTION("malformed descriptor") {
        nlohmann::json descriptor = propose(1);
        descriptor.erase("logsBloom");
        nlohmann::json reply;
        api.handle_engine_validate_l2_block(make_request("engine_validateL2Block", nlohmann::json::array({descriptor})), reply);
        CHECK(reply["error"]["code"] == kInvalidParams);
    }
}

TEST_CASE_METHOD(L2EngineRpcApiTest, "L2EngineRpcApi: engine_newL2Block", "[rollnode][rpc][engine_api]") {
    SECTION("commit without aggregate signature") {
        const auto data{propose(1)};
        nlohmann::json reply;
        api.handle_engine_new_l2_block(make_request("engine_newL2Block", nlohmann::json::array({data})), reply);
        CHECK(reply == R"({"jsonrpc":"2.0","id":1,"result":null})"_json);
        CHECK(store.write_count() == 1);
        CHECK(store.current_header().number == 1);
    }
    SECTION("commit with aggregate signature") {
        const auto data{propose(1)};
        const BlsData bls{.signers = {*from_hex("0x01")}, .signature = *from_hex("0xabcd")};
        nlohmann::json reply;
        api.handle_engine_new_l2_block(make_request("engine_newL2Block", nlohmann::json::array({data, bls})), reply);
        CHECK(reply["result"].is_null());
        REQUIRE(store.current_block().header.bls_data);
        CHECK(*store.current_block().header.bls_data == bls);
    }
    SECTION("verification failure is an error") {
        auto data{propose(1)};
        data.extra_data = Bytes(FakeConsensusEngine::kMaxExtraDataBytes + 1, 0xff);
        nlohmann::json reply;
        api.handle_engine_new_l2_block(make_request("engine_newL2Block", nlohmann::json::array({data})), reply);
        CHECK(reply["error"]["code"] == kServerError);
        CHECK_THAT(reply["error"]["message"].get<std::string>(), ContainsSubstring("failed to verify block"));
        CHECK(store.write_count() == 0);
    }
    SECTION("store failure is an internal error") {
        store.fail_writes = true;
        nlohmann::json reply;
        api.handle_engine_new_l2_block(make_request("engine_newL2Block", nlohmann::json::array({propose(1)})), reply);
        CHECK(reply["error"]["code"] == kInternalError);
        CHECK(store.current_header().number == 0);
    }
    SECTION("malformed aggregate signature") {
        nlohmann::json reply;
        api.handle_engine_new_l2_block(
            make_request("engine_newL2Block", nlohmann::json::array({propose(1), "0xdead"})), reply);
        CHECK(reply["error"]["code"] == kInvalidParams);
        CHECK(store.write_count() == 0);
        CHECK(store.current_header().number == 0);
    }
    SECTION("too many params") {
        nlohmann::json reply;
        api.handle_engine_new_l2_block(
            make_request("engine_newL2Block", nlohmann::json::array({propose(1), nullptr, nullptr})), reply);
        CHECK(reply["error"]["code"] == kInvalidParams);
    }
}

}  // namespace rollnode::rpc::commands
