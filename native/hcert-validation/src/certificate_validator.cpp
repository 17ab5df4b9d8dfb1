// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file certificate_validator.cpp
 * @brief Implementation of CertificateValidator.
 */

#include "hcert/validation/certificate_validator.h"

#include <utility>
#include <vector>

#include <hcert/common/logging.h>

namespace hcert::validation {

CertificateValidator::CertificateValidator(std::string validator_name, rules::Clock clock)
    : validator_name_(std::move(validator_name)), default_rule_(rules::Default(std::move(clock))) {}

ValidationResult CertificateValidator::Validate(const Certificate& certificate) const {
  return Validate(certificate, default_rule_);
}

ValidationResult CertificateValidator::Validate(const Certificate& certificate, const ValidationRule& rule) const {
  RuleEvaluation evaluation = rule.Evaluate(certificate);
  if (evaluation.satisfied) {
    return ValidationResult::Success(validator_name_);
  }

  ValidationRule unsatisfied = evaluation.unsatisfied_rule.value_or(rule);
  hcert::common::Logger()->debug("{}: rule {} not satisfied", validator_name_, unsatisfied.tag());

  ValidationFailure f;
  f.message = "Validation rule not satisfied: " + unsatisfied.tag();
  f.error_code = kRuleUnsatisfied;
  f.unsatisfied_rule = std::move(unsatisfied);
  std::vector<ValidationFailure> failures;
  failures.push_back(std::move(f));
  return ValidationResult::Failure(validator_name_, std::move(failures));
}

} // namespace hcert::validation
