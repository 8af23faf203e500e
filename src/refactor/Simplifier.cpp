#include "refactor/Simplifier.hpp"

namespace lfx {

bool Simplifier::needsNoParens(const SyntaxNode& e) {
  switch (e.kind) {
  case NodeKind::IdentifierName:
  case NodeKind::NumericLiteral:
  case NodeKind::StringLiteral:
  case NodeKind::TrueLiteral:
  case NodeKind::FalseLiteral:
  case NodeKind::NullLiteral:
  case NodeKind::MemberAccess:
  case NodeKind::Invocation:
  case NodeKind::ObjectCreation:
  case NodeKind::ArrayCreation:
  case NodeKind::CollectionLiteral:
  case NodeKind::InterpolatedString:
  case NodeKind::Parenthesized:
    return true;
  default:
    return false;
  }
}

NodePtr Simplifier::unwrap(const NodePtr& e) {
  NodePtr cur = e;
  while (cur && cur->is(NodeKind::Parenthesized) && cur->child(0) && needsNoParens(*cur->child(0)))
    cur = cur->children[0];
  return cur;
}

NodePtr Simplifier::reduce(const NodePtr& node) {
  if (!node || !node->is(NodeKind::CollectionLiteral)) return node;

  bool changed = false;
  std::vector<NodePtr> elements;
  for (const auto& e : node->children) {
    if (e && e->is(NodeKind::SpreadElement) && e->child(0)) {
      auto operand = unwrap(e->children[0]);
      if (operand->is(NodeKind::CollectionLiteral)) {
        auto inner = reduce(operand);
        elements.insert(elements.end(), inner->children.begin(), inner->children.end());
        changed = true;
        continue;
      }
      if (operand != e->children[0]) {
        elements.push_back(spreadElement(operand));
        changed = true;
        continue;
      }
      elements.push_back(e);
      continue;
    }
    auto plain = unwrap(e);
    changed |= plain != e;
    elements.push_back(plain);
  }
  return changed ? withChildren(*node, std::move(elements)) : node;
}

} // namespace lfx
