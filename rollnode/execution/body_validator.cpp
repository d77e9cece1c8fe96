// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "body_validator.hpp"

#include <rollnode/infra/common/log.hpp>

namespace rollnode::execution {

ValidationResult ChainBodyValidator::validate_body(const Block& block) {
    const ValidationResult result{protocol::pre_validate_block_body(block, config_)};
    if (result != ValidationResult::kOk) {
        ROLL_DEBUG << "ChainBodyValidator::validate_body block=" << block.header.number
                   << " result=" << protocol::to_string(result);
    }
    return result;
}

}  // namespace rollnode::execution
