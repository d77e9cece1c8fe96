// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <rollnode/core/protocol/validation.hpp>
#include <rollnode/core/types/block.hpp>

namespace rollnode::execution::api {

struct BodyValidator {
    virtual ~BodyValidator() = default;

    //! \brief Structural checks of the body against the header (transactions root, ommers, gas)
    virtual ValidationResult validate_body(const Block& block) = 0;
};

}  // namespace rollnode::execution::api
