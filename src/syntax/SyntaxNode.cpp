#include "syntax/SyntaxNode.hpp"

#include <array>
#include <utility>

namespace lfx {

namespace {

constexpr std::array<const char*, static_cast<size_t>(NodeKind::Count_)> kKindNames = {
  "unit", "using", "namespace", "class", "method", "params", "param", "block",
  "local", "expr-stmt", "return", "typename", "id", "num", "str", "true",
  "false", "null", "member", "binding", "cond-access", "call", "args", "new",
  "array-new", "init", "collection", "spread", "binary", "paren", "lambda",
  "interp", "interp-text", "interp-hole",
};

} // namespace

const char* kindName(NodeKind k) {
  auto i = static_cast<size_t>(k);
  return i < kKindNames.size() ? kKindNames[i] : "?";
}

std::optional<NodeKind> kindFromName(std::string_view name) {
  for (size_t i = 0; i < kKindNames.size(); ++i)
    if (name == kKindNames[i]) return static_cast<NodeKind>(i);
  return std::nullopt;
}

const SyntaxNode* SyntaxNode::childOfKind(NodeKind k) const {
  for (const auto& c : children)
    if (c && c->kind == k) return c.get();
  return nullptr;
}

NodePtr makeNode(NodeKind kind, std::string text, std::vector<NodePtr> children) {
  auto n = std::make_shared<SyntaxNode>();
  n->kind = kind;
  n->text = std::move(text);
  n->children = std::move(children);
  return n;
}

NodePtr makeNode(NodeKind kind, std::initializer_list<NodePtr> children) {
  return makeNode(kind, std::string(), std::vector<NodePtr>(children));
}

NodePtr withChildren(const SyntaxNode& node, std::vector<NodePtr> children) {
  return makeNode(node.kind, node.text, std::move(children));
}

NodePtr identifier(std::string name) { return makeNode(NodeKind::IdentifierName, std::move(name)); }
NodePtr typeName(std::string spelled) { return makeNode(NodeKind::TypeName, std::move(spelled)); }
NodePtr numericLiteral(std::string token) { return makeNode(NodeKind::NumericLiteral, std::move(token)); }
NodePtr stringLiteral(std::string contents) { return makeNode(NodeKind::StringLiteral, std::move(contents)); }

NodePtr memberAccess(NodePtr receiver, std::string name) {
  return makeNode(NodeKind::MemberAccess, {std::move(receiver), identifier(std::move(name))});
}

NodePtr invocation(NodePtr callee, std::vector<NodePtr> args) {
  return makeNode(NodeKind::Invocation,
                  {std::move(callee), makeNode(NodeKind::ArgumentList, {}, std::move(args))});
}

NodePtr objectCreation(std::string type, std::optional<std::vector<NodePtr>> args,
                       std::optional<std::vector<NodePtr>> initializer) {
  std::vector<NodePtr> parts{typeName(std::move(type))};
  if (args) parts.push_back(makeNode(NodeKind::ArgumentList, {}, std::move(*args)));
  if (initializer) parts.push_back(makeNode(NodeKind::InitializerList, {}, std::move(*initializer)));
  return makeNode(NodeKind::ObjectCreation, {}, std::move(parts));
}

NodePtr collectionLiteral(std::vector<NodePtr> elements) {
  return makeNode(NodeKind::CollectionLiteral, {}, std::move(elements));
}

NodePtr spreadElement(NodePtr expr) {
  return makeNode(NodeKind::SpreadElement, {std::move(expr)});
}

} // namespace lfx
