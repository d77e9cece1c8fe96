// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "l2_engine_api.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

#include <rollnode/core/common/util.hpp>
#include <rollnode/infra/common/log.hpp>
#include <rollnode/l2/errors.hpp>
#include <rollnode/rpc/json/l2_block.hpp>
#include <rollnode/rpc/json/types.hpp>
#include <rollnode/rpc/json_rpc/methods.hpp>
#include <rollnode/rpc/protocol/errors.hpp>

namespace rollnode::rpc::commands {

namespace {

    //! Descriptors may carry thousands of transactions
    constexpr size_t kMaxLoggedRequestLength{256};

    std::string request_for_log(const nlohmann::json& request) {
        return abridge(request.dump(), kMaxLoggedRequestLength);
    }

    //! Protocol and verification errors are the caller's business, executor and store faults are ours
    int64_t to_error_code(const l2::L2Error& error) {
        if (error.is_protocol_error() || error.code() == l2::L2ErrorCode::kVerificationFailed) {
            return kServerError;
        }
        return kInternalError;
    }

    nlohmann::json make_l2_error(const nlohmann::json& request, const l2::L2Error& error) {
        ROLL_ERROR << "error: \"" << error.what() << "\" processing request: " << request_for_log(request);
        return make_json_error(request, to_error_code(error), error.what());
    }

    nlohmann::json make_internal_error(const nlohmann::json& request, const std::exception& e) {
        ROLL_ERROR << "exception: " << e.what() << " processing request: " << request_for_log(request);
        return make_json_error(request, kInternalError, e.what());
    }

    nlohmann::json make_invalid_params(const nlohmann::json& request, const std::string& method, const std::string& reason) {
        auto error_msg = "invalid " + method + " params: " + reason;
        ROLL_ERROR << error_msg;
        return make_json_error(request, kInvalidParams, error_msg);
    }

}  // namespace

L2EngineRpcApi::L2EngineRpcApi(l2::BlockCoordinator& coordinator, const ChainConfig& config)
    : coordinator_{coordinator} {
    if (!config.terminal_total_difficulty) {
        throw std::invalid_argument{"l2 engine started without valid terminal total difficulty"};
    }
    method_handlers_[json_rpc::method::k_engine_assembleL2Block] = &L2EngineRpcApi::handle_engine_assemble_l2_block;
    method_handlers_[json_rpc::method::k_engine_validateL2Block] = &L2EngineRpcApi::handle_engine_validate_l2_block;
    method_handlers_[json_rpc::method::k_engine_newL2Block] = &L2EngineRpcApi::handle_engine_new_l2_block;
    ROLL_INFO << "Engine API enabled" << log::Args{"namespace", kEngineApiNamespace, "version", kEngineApiVersion};
}

nlohmann::json L2EngineRpcApi::handle_request(const nlohmann::json& request) {
    if (!request.is_object() || !request.contains("method") || !request.at("method").is_string()) {
        ROLL_ERROR << "invalid request: " << request_for_log(request);
        return make_json_error(request.is_object() ? request : nlohmann::json::object(), kInvalidRequest, "invalid request");
    }
    const auto method{request.at("method").get<std::string>()};
    const auto handler{method_handlers_.find(method)};
    if (handler == method_handlers_.end()) {
        ROLL_DEBUG << "method not found: " << method;
        return make_json_error(request, kMethodNotFound, "the method " + method + " does not exist/is not available");
    }
    if (!request.contains("params") || !request.at("params").is_array()) {
        return make_invalid_params(request, method, "missing params array");
    }

    nlohmann::json reply;
    (this->*(handler->second))(request, reply);
    return reply;
}

void L2EngineRpcApi::handle_engine_assemble_l2_block(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request.at("params");
    if (params.size() != 1) {
        reply = make_invalid_params(request, json_rpc::method::k_engine_assembleL2Block, params.dump());
        return;
    }

    l2::AssembleL2BlockParams assemble_params;
    try {
        assemble_params = params[0].get<l2::AssembleL2BlockParams>();
    } catch (const std::exception& e) {
        reply = make_invalid_params(request, json_rpc::method::k_engine_assembleL2Block, e.what());
        return;
    }

    try {
        const auto data = coordinator_.assemble_l2_block(assemble_params);
        if (!data) {
            reply = make_json_content(request);
            return;
        }
        reply = make_json_content(request, *data);
    } catch (const l2::L2Error& error) {
        reply = make_l2_error(request, error);
    } catch (const std::exception& e) {
        reply = make_internal_error(request, e);
    }
}

void L2EngineRpcApi::handle_engine_validate_l2_block(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request.at("params");
    if (params.size() != 1) {
        reply = make_invalid_params(request, json_rpc::method::k_engine_validateL2Block, params.dump());
        return;
    }

    l2::ExecutableL2Data data;
    try {
        data = params[0].get<l2::ExecutableL2Data>();
    } catch (const std::exception& e) {
        reply = make_invalid_params(request, json_rpc::method::k_engine_validateL2Block, e.what());
        return;
    }

    try {
        const bool valid = coordinator_.validate_l2_block(data);
        reply = make_json_content(request, {{"valid", valid}});
    } catch (const l2::L2Error& error) {
        reply = make_l2_error(request, error);
    } catch (const std::exception& e) {
        reply = make_internal_error(request, e);
    }
}

void L2EngineRpcApi::handle_engine_new_l2_block(const nlohmann::json& request, nlohmann::json& reply) {
    const auto& params = request.at("params");
    // Aggregate-signature data may be omitted
    if (params.empty() || params.size() > 2) {
        reply = make_invalid_params(request, json_rpc::method::k_engine_newL2Block, params.dump());
        return;
    }

    l2::ExecutableL2Data data;
    BlsData bls_data;
    try {
        data = params[0].get<l2::ExecutableL2Data>();
        if (params.size() == 2) {
            bls_data = params[1].get<BlsData>();
        }
    } catch (const std::exception& e) {
        reply = make_invalid_params(request, json_rpc::method::k_engine_newL2Block, e.what());
        return;
    }

    try {
        coordinator_.new_l2_block(data, bls_data);
        reply = make_json_content(request);
    } catch (const l2::L2Error& error) {
        reply = make_l2_error(request, error);
    } catch (const std::exception& e) {
        reply = make_internal_error(request, e);
    }
}

}  // namespace rollnode::rpc::commands
