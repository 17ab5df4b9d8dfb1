// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

/**
 * @file validation_rule.cpp
 * @brief Rule tree construction and the attributing evaluator.
 */

#include "hcert/validation/validation_rule.h"

#include <stdexcept>
#include <variant>

namespace hcert::validation {

struct ValidationRule::Node {
  struct LeafNode {
    Predicate predicate;
  };
  struct AndNode {
    ValidationRule left;
    ValidationRule right;
  };
  struct OrNode {
    ValidationRule left;
    ValidationRule right;
  };
  struct NotNode {
    ValidationRule inner;
  };

  std::string tag;
  std::variant<LeafNode, AndNode, OrNode, NotNode> body;
};

ValidationRule ValidationRule::Leaf(std::string tag, Predicate predicate) {
  if (!predicate) {
    throw std::invalid_argument("predicate");
  }
  return ValidationRule(std::make_shared<const Node>(Node{std::move(tag), Node::LeafNode{std::move(predicate)}}));
}

ValidationRule ValidationRule::Constant(bool value) {
  return Leaf(value ? "true" : "false", [value](const Certificate&) { return value; });
}

ValidationRule ValidationRule::And(ValidationRule left, ValidationRule right) {
  std::string tag = "(" + left.tag() + " && " + right.tag() + ")";
  return ValidationRule(std::make_shared<const Node>(Node{std::move(tag), Node::AndNode{std::move(left), std::move(right)}}));
}

ValidationRule ValidationRule::Or(ValidationRule left, ValidationRule right) {
  std::string tag = "(" + left.tag() + " || " + right.tag() + ")";
  return ValidationRule(std::make_shared<const Node>(Node{std::move(tag), Node::OrNode{std::move(left), std::move(right)}}));
}

ValidationRule ValidationRule::Not(ValidationRule inner) {
  std::string tag = "!" + inner.tag();
  return ValidationRule(std::make_shared<const Node>(Node{std::move(tag), Node::NotNode{std::move(inner)}}));
}

ValidationRule::Kind ValidationRule::kind() const {
  switch (node_->body.index()) {
    case 0:
      return Kind::kLeaf;
    case 1:
      return Kind::kAnd;
    case 2:
      return Kind::kOr;
    default:
      return Kind::kNot;
  }
}

const std::string& ValidationRule::tag() const {
  return node_->tag;
}

std::vector<ValidationRule> ValidationRule::operands() const {
  if (const auto* n = std::get_if<Node::AndNode>(&node_->body)) {
    return {n->left, n->right};
  }
  if (const auto* n = std::get_if<Node::OrNode>(&node_->body)) {
    return {n->left, n->right};
  }
  if (const auto* n = std::get_if<Node::NotNode>(&node_->body)) {
    return {n->inner};
  }
  return {};
}

RuleEvaluation ValidationRule::Evaluate(const Certificate& certificate) const {
  if (const auto* leaf = std::get_if<Node::LeafNode>(&node_->body)) {
    if (leaf->predicate(certificate)) {
      return RuleEvaluation{true, std::nullopt};
    }
    return RuleEvaluation{false, *this};
  }

  if (const auto* n = std::get_if<Node::AndNode>(&node_->body)) {
    RuleEvaluation left = n->left.Evaluate(certificate);
    if (!left.satisfied) {
      return left;
    }
    return n->right.Evaluate(certificate);
  }

  if (const auto* n = std::get_if<Node::OrNode>(&node_->body)) {
    RuleEvaluation left = n->left.Evaluate(certificate);
    if (left.satisfied) {
      return left;
    }
    // Both alternatives failed: report the last one tried.
    return n->right.Evaluate(certificate);
  }

  const auto& n = std::get<Node::NotNode>(node_->body);
  if (n.inner.Evaluate(certificate).satisfied) {
    return RuleEvaluation{false, *this};
  }
  return RuleEvaluation{true, std::nullopt};
}

} // namespace hcert::validation
