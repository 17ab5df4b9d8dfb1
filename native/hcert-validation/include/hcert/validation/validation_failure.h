// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file validation_failure.h
 * @brief Structured failure details produced by validators.
 */

#include <optional>
#include <string>

#include "hcert/validation/validation_rule.h"

namespace hcert::validation {

struct ValidationFailure {
  std::string message;
  std::optional<std::string> error_code;
  std::optional<std::string> property_name;

  // Set when a rule evaluation failed: the most specific rule that was not satisfied.
  std::optional<ValidationRule> unsatisfied_rule;
};

} // namespace hcert::validation
