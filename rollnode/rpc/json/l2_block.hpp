// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <rollnode/core/types/bls_data.hpp>
#include <rollnode/l2/types.hpp>

namespace rollnode::l2 {

void to_json(nlohmann::json& json, const ExecutableL2Data& data);
void from_json(const nlohmann::json& json, ExecutableL2Data& data);

void to_json(nlohmann::json& json, const AssembleL2BlockParams& params);
void from_json(const nlohmann::json& json, AssembleL2BlockParams& params);

}  // namespace rollnode::l2

namespace rollnode {

void to_json(nlohmann::json& json, const BlsData& bls_data);
void from_json(const nlohmann::json& json, BlsData& bls_data);

}  // namespace rollnode
