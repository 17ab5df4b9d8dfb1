// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file certificate_validator.h
 * @brief Applies a rule tree to a decoded certificate.
 */

#include <string>

#include "hcert/validation/rules.h"
#include "hcert/validation/validation_result.h"
#include "hcert/validation/validation_rule.h"

namespace hcert::validation {

inline constexpr const char* kRuleUnsatisfied = "RULE_UNSATISFIED";

/**
 * @brief Validates certificates against rules::Default or a caller-supplied rule.
 *
 * On failure the result carries a single ValidationFailure whose unsatisfied_rule is the most
 * specific rule that was not met (see ValidationRule::Evaluate) and whose error_code is
 * kRuleUnsatisfied. The validator holds no mutable state.
 */
class CertificateValidator final {
 public:
  /**
   * @param validator_name Name reported in ValidationResult.
   * @param clock Time source used by the default rule.
   */
  explicit CertificateValidator(std::string validator_name = "CertificateValidator",
                                rules::Clock clock = rules::SystemClock());

  ValidationResult Validate(const Certificate& certificate) const;
  ValidationResult Validate(const Certificate& certificate, const ValidationRule& rule) const;

  const ValidationRule& default_rule() const { return default_rule_; }

 private:
  std::string validator_name_;
  ValidationRule default_rule_;
};

} // namespace hcert::validation
