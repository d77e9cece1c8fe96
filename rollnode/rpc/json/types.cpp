// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include <rollnode/core/common/endian.hpp>
#include <rollnode/core/common/util.hpp>
#include <rollnode/core/types/address.hpp>
#include <rollnode/core/types/evmc_bytes32.hpp>

namespace rollnode::rpc {

uint64_t from_quantity(const std::string& hex_quantity) {
    // At most 16 hex digits after the prefix
    if (!has_hex_prefix(hex_quantity) || hex_quantity.size() < 3 || hex_quantity.size() > 18) {
        throw std::invalid_argument{"invalid hex quantity: " + hex_quantity};
    }
    uint64_t value{0};
    const char* first{hex_quantity.data() + 2};
    const char* last{hex_quantity.data() + hex_quantity.size()};
    const auto [ptr, ec] = std::from_chars(first, last, value, 16);
    if (ec != std::errc{} || ptr != last) {
        throw std::invalid_argument{"invalid hex quantity: " + hex_quantity};
    }
    return value;
}

std::string to_quantity(uint64_t number) {
    return to_quantity(endian::to_big_compact(number));
}

std::string to_quantity(const intx::uint256& number) {
    if (number == 0) {
        return "0x0";
    }
    return to_quantity(endian::to_big_compact(number));
}

std::string to_quantity(ByteView bytes) {
    std::string hex{to_hex(zeroless_view(bytes))};
    const auto first_non_zero{hex.find_first_not_of('0')};
    if (first_non_zero == std::string::npos) {
        return "0x0";
    }
    return "0x" + hex.substr(first_non_zero);
}

Bytes bytes_from_hex(const std::string& hex) {
    if (!has_hex_prefix(hex)) {
        throw std::invalid_argument{"hex string without 0x prefix: " + hex};
    }
    if (hex.size() % 2 != 0) {
        throw std::invalid_argument{"odd length hex string: " + hex};
    }
    auto bytes{from_hex(hex)};
    if (!bytes) {
        throw std::invalid_argument{"invalid hex string: " + hex};
    }
    return std::move(*bytes);
}

Bloom bloom_from_hex(const std::string& hex) {
    const Bytes bytes{bytes_from_hex(hex)};
    if (bytes.size() != kBloomByteLength) {
        throw std::invalid_argument{"invalid logs bloom length: " + std::to_string(bytes.size())};
    }
    Bloom bloom;
    std::copy(bytes.begin(), bytes.end(), bloom.begin());
    return bloom;
}

nlohmann::json make_json_content(const nlohmann::json& request_json) {
    const nlohmann::json id = request_json.contains("id") ? request_json["id"] : nullptr;

    return {{"jsonrpc", kJsonVersion}, {"id", id}, {"result", nullptr}};
}

nlohmann::json make_json_content(const nlohmann::json& request_json, const nlohmann::json& result) {
    const nlohmann::json id = request_json.contains("id") ? request_json["id"] : nullptr;
    nlohmann::json json{{"jsonrpc", kJsonVersion}, {"id", id}, {"result", result}};
    return json;
}

nlohmann::json make_json_error(const nlohmann::json& request_json, int64_t code, const std::string& message) {
    const nlohmann::json id = request_json.contains("id") ? request_json["id"] : nullptr;
    const nlohmann::json error{{"code", code}, {"message", message}};
    return {{"jsonrpc", kJsonVersion}, {"id", id}, {"error", error}};
}

}  // namespace rollnode::rpc

namespace evmc {

void to_json(nlohmann::json& json, const address& addr) {
    json = rollnode::address_to_hex(addr);
}

void from_json(const nlohmann::json& json, address& addr) {
    const auto bytes{rollnode::rpc::bytes_from_hex(json.get<std::string>())};
    if (bytes.size() != rollnode::kAddressLength) {
        throw std::invalid_argument{"invalid address length: " + std::to_string(bytes.size())};
    }
    addr = rollnode::bytes_to_address(bytes);
}

void to_json(nlohmann::json& json, const bytes32& b32) {
    json = rollnode::to_hex(b32, true);
}

void from_json(const nlohmann::json& json, bytes32& b32) {
    const auto bytes{rollnode::rpc::bytes_from_hex(json.get<std::string>())};
    if (bytes.size() != rollnode::kHashLength) {
        throw std::invalid_argument{"invalid hash length: " + std::to_string(bytes.size())};
    }
    b32 = rollnode::to_bytes32(bytes);
}

}  // namespace evmc

namespace intx {

void from_json(const nlohmann::json& json, uint256& ui256) {
    ui256 = intx::from_string<intx::uint256>(json.get<std::string>());
}

}  // namespace intx
