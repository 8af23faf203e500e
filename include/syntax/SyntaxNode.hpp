#pragma once
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lfx {

// Node kinds of the C#-shaped syntax trees the engine inspects.
// Children layout per kind is documented next to each tag.
enum class NodeKind : std::uint8_t {
  CompilationUnit,      // members...
  UsingDirective,       // text = namespace
  NamespaceDecl,        // text = name; members...
  ClassDecl,            // text = name; members...
  MethodDecl,           // text = name; [TypeName return, ParameterList, Block]
  ParameterList,        // Parameter...
  Parameter,            // text = name; [TypeName]
  Block,                // statements...
  LocalDeclaration,     // text = name; [TypeName, initializer]
  ExpressionStatement,  // [expr]
  ReturnStatement,      // [expr?]
  TypeName,             // text = spelled type
  IdentifierName,       // text = name
  NumericLiteral,       // text = token
  StringLiteral,        // text = contents without quotes
  TrueLiteral,
  FalseLiteral,
  NullLiteral,
  MemberAccess,         // [receiver, IdentifierName]
  MemberBinding,        // [IdentifierName]  (the ".Name" of a?.Name)
  ConditionalAccess,    // [receiver, whenNotNull]
  Invocation,           // [callee, ArgumentList]
  ArgumentList,         // args...
  ObjectCreation,       // [TypeName, ArgumentList?, InitializerList?]
  ArrayCreation,        // [TypeName, InitializerList]
  InitializerList,      // elements...
  CollectionLiteral,    // elements / SpreadElement...
  SpreadElement,        // [expr]
  BinaryExpression,     // text = operator; [lhs, rhs]
  Parenthesized,        // [expr]
  Lambda,               // text = parameter; [body]
  InterpolatedString,   // InterpolatedText / Interpolation...
  InterpolatedText,     // text = raw text
  Interpolation,        // [expr]
  Count_
};

const char* kindName(NodeKind k);
std::optional<NodeKind> kindFromName(std::string_view name);

struct SyntaxNode;
using NodePtr = std::shared_ptr<const SyntaxNode>;

// Immutable syntax node. Position and parent live in the owning SyntaxTree,
// so one node can be shared by several trees after a rewrite.
struct SyntaxNode {
  NodeKind kind = NodeKind::CompilationUnit;
  std::string text;
  std::vector<NodePtr> children;

  const SyntaxNode* child(size_t i) const {
    return i < children.size() ? children[i].get() : nullptr;
  }
  // First direct child of the given kind, if any.
  const SyntaxNode* childOfKind(NodeKind k) const;
  bool is(NodeKind k) const { return kind == k; }
};

NodePtr makeNode(NodeKind kind, std::string text = {}, std::vector<NodePtr> children = {});
NodePtr makeNode(NodeKind kind, std::initializer_list<NodePtr> children);
// Copy of `node` with a different child list (kind and text kept).
NodePtr withChildren(const SyntaxNode& node, std::vector<NodePtr> children);

// Small factory helpers used by fixes and tests.
NodePtr identifier(std::string name);
NodePtr typeName(std::string spelled);
NodePtr numericLiteral(std::string token);
NodePtr stringLiteral(std::string contents);
NodePtr memberAccess(NodePtr receiver, std::string name);
NodePtr invocation(NodePtr callee, std::vector<NodePtr> args);
NodePtr objectCreation(std::string type, std::optional<std::vector<NodePtr>> args,
                       std::optional<std::vector<NodePtr>> initializer = std::nullopt);
NodePtr collectionLiteral(std::vector<NodePtr> elements);
NodePtr spreadElement(NodePtr expr);

} // namespace lfx
