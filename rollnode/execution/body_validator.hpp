// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rollnode/core/chain/config.hpp>
#include <rollnode/execution/api/body_validator.hpp>

namespace rollnode::execution {

//! \brief Stateless body validator backed by protocol::pre_validate_block_body
class ChainBodyValidator : public api::BodyValidator {
  public:
    explicit ChainBodyValidator(const ChainConfig& config) : config_{config} {}

    ValidationResult validate_body(const Block& block) override;

  private:
    const ChainConfig& config_;
};

}  // namespace rollnode::execution
