// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <rollnode/core/common/bytes.hpp>
#include <rollnode/core/types/bloom.hpp>

namespace rollnode::rpc {

inline constexpr const char* kJsonVersion{"2.0"};

//! \brief Parses a 0x-prefixed hex quantity, throws std::invalid_argument if malformed or out of range
uint64_t from_quantity(const std::string& hex_quantity);

std::string to_quantity(uint64_t number);
std::string to_quantity(const intx::uint256& number);
std::string to_quantity(ByteView bytes);

//! \brief Parses a 0x-prefixed hex byte string, throws std::invalid_argument if malformed
Bytes bytes_from_hex(const std::string& hex);

Bloom bloom_from_hex(const std::string& hex);

nlohmann::json make_json_content(const nlohmann::json& request_json);
nlohmann::json make_json_content(const nlohmann::json& request_json, const nlohmann::json& result);
nlohmann::json make_json_error(const nlohmann::json& request_json, int64_t code, const std::string& message);

}  // namespace rollnode::rpc

namespace evmc {

void to_json(nlohmann::json& json, const address& addr);
void from_json(const nlohmann::json& json, address& addr);

void to_json(nlohmann::json& json, const bytes32& b32);
void from_json(const nlohmann::json& json, bytes32& b32);

}  // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256);

}  // namespace intx
