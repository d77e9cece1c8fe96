// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include <rollnode/core/chain/config.hpp>
#include <rollnode/l2/block_coordinator.hpp>

namespace rollnode::rpc::commands {

inline constexpr const char* kEngineApiNamespace{"engine"};
inline constexpr const char* kEngineApiVersion{"1.0"};

//! \brief Control API used by the sequencer to drive block production on the layer-2 chain
class L2EngineRpcApi {
  public:
    using HandleMethod = void (L2EngineRpcApi::*)(const nlohmann::json&, nlohmann::json&);

    //! \throws std::invalid_argument if the chain has no terminal total difficulty
    L2EngineRpcApi(l2::BlockCoordinator& coordinator, const ChainConfig& config);
    virtual ~L2EngineRpcApi() = default;

    L2EngineRpcApi(const L2EngineRpcApi&) = delete;
    L2EngineRpcApi& operator=(const L2EngineRpcApi&) = delete;

    //! \brief Dispatches one JSON-RPC request and returns the complete reply object
    nlohmann::json handle_request(const nlohmann::json& request);

  protected:
    void handle_engine_assemble_l2_block(const nlohmann::json& request, nlohmann::json& reply);
    void handle_engine_validate_l2_block(const nlohmann::json& request, nlohmann::json& reply);
    void handle_engine_new_l2_block(const nlohmann::json& request, nlohmann::json& reply);

  private:
    l2::BlockCoordinator& coordinator_;
    std::map<std::string, HandleMethod> method_handlers_;
};

}  // namespace rollnode::rpc::commands
