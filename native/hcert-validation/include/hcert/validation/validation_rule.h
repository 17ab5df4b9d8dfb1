// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#pragma once

/**
 * @file validation_rule.h
 * @brief Composable, tagged predicates over a decoded certificate.
 */

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <hcert/decoder/certificate.h>

namespace hcert::validation {

using Certificate = hcert::decoder::Certificate;

struct RuleEvaluation;

/**
 * @brief A node of a rule tree: Leaf(tag, predicate), And, Or or Not.
 *
 * Rules are immutable and cheap to copy (subtrees are shared), and evaluation has no side
 * effects beyond those of the leaf predicates, so a rule can be reused across certificates
 * and threads.
 */
class ValidationRule {
 public:
  using Predicate = std::function<bool(const Certificate&)>;

  enum class Kind { kLeaf, kAnd, kOr, kNot };

  // Copies share the node. No move operations are declared, so moving copies too and a
  // rule always has a node.
  ValidationRule(const ValidationRule&) = default;
  ValidationRule& operator=(const ValidationRule&) = default;

  /**
   * @brief Creates a leaf rule.
   * @throws std::invalid_argument if @p predicate is empty.
   */
  static ValidationRule Leaf(std::string tag, Predicate predicate);

  static ValidationRule Constant(bool value);

  static ValidationRule And(ValidationRule left, ValidationRule right);
  static ValidationRule Or(ValidationRule left, ValidationRule right);
  static ValidationRule Not(ValidationRule inner);

  Kind kind() const;

  // Leaf tags are given by the caller; composites derive theirs, e.g. "(a && !b)".
  const std::string& tag() const;

  // Left/right for And/Or, the single inner rule for Not, empty for leaves.
  std::vector<ValidationRule> operands() const;

  bool operator()(const Certificate& certificate) const;

  RuleEvaluation Evaluate(const Certificate& certificate) const;

  // Rules are compared by node identity.
  bool operator==(const ValidationRule& other) const { return node_ == other.node_; }

 private:
  struct Node;

  explicit ValidationRule(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

  std::shared_ptr<const Node> node_;
};

/**
 * @brief Outcome of evaluating a rule tree.
 *
 * When not satisfied, unsatisfied_rule is the most specific rule responsible: the failing
 * leaf for And/Or composites, or the Not node itself.
 */
struct RuleEvaluation {
  bool satisfied = false;
  std::optional<ValidationRule> unsatisfied_rule;
};

inline bool ValidationRule::operator()(const Certificate& certificate) const {
  return Evaluate(certificate).satisfied;
}

inline ValidationRule operator&&(ValidationRule left, ValidationRule right) {
  return ValidationRule::And(std::move(left), std::move(right));
}

inline ValidationRule operator||(ValidationRule left, ValidationRule right) {
  return ValidationRule::Or(std::move(left), std::move(right));
}

inline ValidationRule operator!(ValidationRule inner) {
  return ValidationRule::Not(std::move(inner));
}

} // namespace hcert::validation
