#pragma once
#include "syntax/SyntaxNode.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace lfx {

// Character range in the rendered text of a tree. line/column are 1-based.
struct Span {
  unsigned start = 0;
  unsigned length = 0;
  unsigned line = 0;
  unsigned column = 0;

  unsigned end() const { return start + length; }
  bool contains(const Span& o) const { return start <= o.start && o.end() <= end(); }
  bool overlaps(const Span& o) const { return start < o.end() && o.start < end(); }
  bool operator==(const Span& o) const { return start == o.start && length == o.length; }
  bool operator!=(const Span& o) const { return !(*this == o); }
};

using NodeEdit = std::pair<const SyntaxNode*, NodePtr>;

// A rooted, rendered syntax tree. Nodes are shared and immutable; the tree
// indexes where each of them sits (span, parent). Rewrites produce new trees.
class SyntaxTree {
public:
  explicit SyntaxTree(NodePtr root, std::string path = {});

  const NodePtr& root() const { return Root; }
  const std::string& path() const { return Path; }
  const std::string& text() const { return Text; }

  bool contains(const SyntaxNode& n) const { return Index.count(&n) != 0; }
  std::optional<Span> span(const SyntaxNode& n) const;
  const SyntaxNode* parent(const SyntaxNode& n) const;
  // Owning handle for a node of this tree (null if the node is not in it).
  NodePtr share(const SyntaxNode& n) const;

  const SyntaxNode* firstAncestor(const SyntaxNode& n, NodeKind k) const;
  const SyntaxNode* firstAncestorOrSelf(const SyntaxNode& n, NodeKind k) const;

  // Outermost node among those with the smallest span covering `s`.
  const SyntaxNode* findNode(const Span& s) const;

  // All nodes, pre-order, left to right.
  const std::vector<const SyntaxNode*>& preorder() const { return Order; }

  // Path-copying replacement. Targets must belong to this tree and must not
  // nest; unaffected subtrees are shared with the result.
  SyntaxTree replaceNodes(const std::vector<NodeEdit>& edits) const;
  SyntaxTree replaceNode(const SyntaxNode& target, NodePtr replacement) const {
    return replaceNodes({NodeEdit(&target, std::move(replacement))});
  }

  // "line:col" of a node, for log lines.
  std::string location(const SyntaxNode& n) const;

private:
  struct Entry {
    Span span;
    const SyntaxNode* parent = nullptr;
    NodePtr self;
  };

  NodePtr Root;
  std::string Path;
  std::string Text;
  std::unordered_map<const SyntaxNode*, Entry> Index;
  std::vector<const SyntaxNode*> Order;
};

} // namespace lfx
