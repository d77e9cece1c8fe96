// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "l2_block.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <rollnode/core/common/util.hpp>
#include <rollnode/rpc/json/types.hpp>

namespace rollnode {

namespace {

    nlohmann::json to_hex_array(const std::vector<Bytes>& items) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& item : items) {
            array.push_back(to_hex(item, /*with_prefix=*/true));
        }
        return array;
    }

    std::vector<Bytes> from_hex_array(const nlohmann::json& json) {
        if (json.is_null()) {
            return {};
        }
        if (!json.is_array()) {
            throw std::invalid_argument{"expected array of hex strings: " + json.dump()};
        }
        std::vector<Bytes> items;
        items.reserve(json.size());
        for (const auto& item : json) {
            items.push_back(rpc::bytes_from_hex(item.get<std::string>()));
        }
        return items;
    }

}  // namespace

void to_json(nlohmann::json& json, const BlsData& bls_data) {
    json["signers"] = to_hex_array(bls_data.signers);
    json["signature"] = to_hex(bls_data.signature, /*with_prefix=*/true);
}

void from_json(const nlohmann::json& json, BlsData& bls_data) {
    if (json.is_null()) {
        bls_data = BlsData{};
        return;
    }
    if (!json.is_object()) {
        throw std::invalid_argument{"expected aggregate signature object: " + json.dump()};
    }
    if (json.contains("signers") && !json.at("signers").is_null()) {
        bls_data.signers = from_hex_array(json.at("signers"));
    }
    if (json.contains("signature") && !json.at("signature").is_null()) {
        bls_data.signature = rpc::bytes_from_hex(json.at("signature").get<std::string>());
    }
}

namespace l2 {

    void to_json(nlohmann::json& json, const ExecutableL2Data& data) {
        json["parentHash"] = data.parent_hash;
        json["number"] = rpc::to_quantity(data.number);
        json["miner"] = data.miner;
        json["timestamp"] = rpc::to_quantity(data.timestamp);
        json["gasLimit"] = rpc::to_quantity(data.gas_limit);
        if (data.base_fee) {
            json["baseFee"] = rpc::to_quantity(*data.base_fee);
        }
        json["extraData"] = to_hex(data.extra_data, /*with_prefix=*/true);
        json["transactions"] = to_hex_array(data.transactions);
        json["stateRoot"] = data.state_root;
        json["gasUsed"] = rpc::to_quantity(data.gas_used);
        json["receiptsRoot"] = data.receipts_root;
        json["logsBloom"] = "0x" + to_hex(ByteView{data.logs_bloom.data(), data.logs_bloom.size()});
    }

    void from_json(const nlohmann::json& json, ExecutableL2Data& data) {
        data.parent_hash = json.at("parentHash").get<evmc::bytes32>();
        data.number = rpc::from_quantity(json.at("number").get<std::string>());
        data.miner = json.at("miner").get<evmc::address>();
        data.timestamp = rpc::from_quantity(json.at("timestamp").get<std::string>());
        data.gas_limit = rpc::from_quantity(json.at("gasLimit").get<std::string>());
        if (json.contains("baseFee") && !json.at("baseFee").is_null()) {
            data.base_fee = json.at("baseFee").get<intx::uint256>();
        } else {
            data.base_fee = std::nullopt;
        }
        if (json.contains("extraData") && !json.at("extraData").is_null()) {
            data.extra_data = rpc::bytes_from_hex(json.at("extraData").get<std::string>());
        } else {
            data.extra_data.clear();
        }
        data.transactions = json.contains("transactions") ? from_hex_array(json.at("transactions")) : std::vector<Bytes>{};
        data.state_root = json.at("stateRoot").get<evmc::bytes32>();
        data.gas_used = rpc::from_quantity(json.at("gasUsed").get<std::string>());
        data.receipts_root = json.at("receiptsRoot").get<evmc::bytes32>();
        data.logs_bloom = rpc::bloom_from_hex(json.at("logsBloom").get<std::string>());
    }

    void to_json(nlohmann::json& json, const AssembleL2BlockParams& params) {
        json["number"] = rpc::to_quantity(params.number);
        json["transactions"] = to_hex_array(params.transactions);
    }

    void from_json(const nlohmann::json& json, AssembleL2BlockParams& params) {
        params.number = rpc::from_quantity(json.at("number").get<std::string>());
        params.transactions = from_hex_array(json.at("transactions"));
    }

}  // namespace l2

}  // namespace rollnode
