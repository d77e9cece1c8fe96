// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace rollnode {

static constexpr const char* kTerminalTotalDifficulty{"terminalTotalDifficulty"};
static constexpr const char* kMaxTxPerBlock{"maxTxPerBlock"};

static inline void member_to_json(nlohmann::json& json, const std::string& key, const std::optional<uint64_t>& source) {
    if (source) {
        json[key] = *source;
    }
}

static inline bool read_json_config_member(const nlohmann::json& json, const std::string& key,
                                           std::optional<uint64_t>& target) {
    if (!json.contains(key)) {
        return true;
    }
    if (!json[key].is_number_unsigned()) {
        return false;
    }
    target = json[key].get<uint64_t>();
    return true;
}

bool ChainConfig::is_valid_tx_count(size_t count) const noexcept {
    return !l2.max_tx_per_block || count <= *l2.max_tx_per_block;
}

nlohmann::json ChainConfig::to_json() const noexcept {
    nlohmann::json ret;

    ret["chainId"] = chain_id;
    member_to_json(ret, "londonBlock", london_block);

    if (terminal_total_difficulty) {
        ret[kTerminalTotalDifficulty] = intx::to_string(*terminal_total_difficulty);
    }

    nlohmann::json l2_json(nlohmann::json::value_t::object);
    member_to_json(l2_json, kMaxTxPerBlock, l2.max_tx_per_block);
    ret["l2"] = l2_json;

    return ret;
}

std::optional<ChainConfig> ChainConfig::from_json(const nlohmann::json& json) noexcept {
    if (json.is_discarded() || !json.contains("chainId") || !json["chainId"].is_number_unsigned()) {
        return std::nullopt;
    }

    ChainConfig config{};
    config.chain_id = json["chainId"].get<uint64_t>();

    if (!read_json_config_member(json, "londonBlock", config.london_block)) {
        return std::nullopt;
    }

    if (json.contains(kTerminalTotalDifficulty)) {
        // Accepted both as a decimal JSON string and as a JSON number
        const auto& ttd{json[kTerminalTotalDifficulty]};
        if (ttd.is_string()) {
            try {
                config.terminal_total_difficulty = intx::from_string<intx::uint256>(ttd.get<std::string>());
            } catch (const std::exception&) {
                // intx rejects malformed or out of range digits by throwing
                return std::nullopt;
            }
        } else if (ttd.is_number_unsigned()) {
            config.terminal_total_difficulty = ttd.get<uint64_t>();
        } else {
            return std::nullopt;
        }
    }

    if (json.contains("l2")) {
        const auto& l2_json{json["l2"]};
        if (!l2_json.is_object() || !read_json_config_member(l2_json, kMaxTxPerBlock, config.l2.max_tx_per_block)) {
            return std::nullopt;
        }
    }

    return config;
}

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj) { return out << obj.to_json(); }

}  // namespace rollnode
