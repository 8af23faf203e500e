#include "syntax/SyntaxTree.hpp"
#include "syntax/SourceWriter.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <unordered_set>

namespace lfx {

SyntaxTree::SyntaxTree(NodePtr root, std::string path)
  : Root(std::move(root)), Path(std::move(path)) {
  if (!Root) throw std::invalid_argument("SyntaxTree: null root");

  std::vector<std::pair<const SyntaxNode*, NodePtr>> handles;
  std::function<void(const NodePtr&)> walk = [&](const NodePtr& n) {
    Order.push_back(n.get());
    handles.emplace_back(n.get(), n);
    for (const auto& c : n->children)
      if (c) walk(c);
  };
  walk(Root);

  SourceWriter writer([this](const SyntaxNode& n, const SyntaxNode* parent,
                             unsigned begin, unsigned end) {
    // A node appearing twice keeps its first position.
    auto& e = Index[&n];
    if (e.span.line != 0) return;
    e.span.start = begin;
    e.span.length = end - begin;
    e.span.line = 1;  // fixed up below
    e.parent = parent;
  });
  Text = writer.render(*Root);

  std::vector<unsigned> lineStarts{0};
  for (unsigned i = 0; i < Text.size(); ++i)
    if (Text[i] == '\n') lineStarts.push_back(i + 1);

  for (auto& [node, handle] : handles) {
    auto& e = Index[node];
    if (!e.self) e.self = handle;
    auto it = std::upper_bound(lineStarts.begin(), lineStarts.end(), e.span.start);
    auto line = static_cast<unsigned>(it - lineStarts.begin());
    e.span.line = line;
    e.span.column = e.span.start - lineStarts[line - 1] + 1;
  }
}

std::optional<Span> SyntaxTree::span(const SyntaxNode& n) const {
  auto it = Index.find(&n);
  if (it == Index.end()) return std::nullopt;
  return it->second.span;
}

const SyntaxNode* SyntaxTree::parent(const SyntaxNode& n) const {
  auto it = Index.find(&n);
  return it == Index.end() ? nullptr : it->second.parent;
}

NodePtr SyntaxTree::share(const SyntaxNode& n) const {
  auto it = Index.find(&n);
  return it == Index.end() ? nullptr : it->second.self;
}

const SyntaxNode* SyntaxTree::firstAncestor(const SyntaxNode& n, NodeKind k) const {
  for (auto* p = parent(n); p; p = parent(*p))
    if (p->kind == k) return p;
  return nullptr;
}

const SyntaxNode* SyntaxTree::firstAncestorOrSelf(const SyntaxNode& n, NodeKind k) const {
  return n.kind == k ? &n : firstAncestor(n, k);
}

const SyntaxNode* SyntaxTree::findNode(const Span& s) const {
  const SyntaxNode* cur = Root.get();
  if (!Index.at(cur).span.contains(s)) return nullptr;

  for (bool descended = true; descended;) {
    descended = false;
    for (const auto& c : cur->children) {
      if (!c) continue;
      auto cs = span(*c);
      if (cs && cs->contains(s)) {
        cur = c.get();
        descended = true;
        break;
      }
    }
  }
  // Climb back over ancestors with an identical span.
  auto mine = Index.at(cur).span;
  for (auto* p = parent(*cur); p && Index.at(p).span == mine; p = parent(*p))
    cur = p;
  return cur;
}

SyntaxTree SyntaxTree::replaceNodes(const std::vector<NodeEdit>& edits) const {
  std::unordered_map<const SyntaxNode*, NodePtr> replacements;
  std::unordered_set<const SyntaxNode*> onPath;
  for (const auto& [target, replacement] : edits) {
    if (!target || !contains(*target))
      throw std::invalid_argument("replaceNodes: target is not part of this tree");
    replacements[target] = replacement;
    for (auto* p = parent(*target); p; p = parent(*p)) onPath.insert(p);
  }

  std::function<NodePtr(const NodePtr&)> rebuild = [&](const NodePtr& n) -> NodePtr {
    auto r = replacements.find(n.get());
    if (r != replacements.end()) return r->second;
    if (!onPath.count(n.get())) return n;

    std::vector<NodePtr> kids;
    kids.reserve(n->children.size());
    for (const auto& c : n->children) kids.push_back(c ? rebuild(c) : c);
    return withChildren(*n, std::move(kids));
  };

  return SyntaxTree(rebuild(Root), Path);
}

std::string SyntaxTree::location(const SyntaxNode& n) const {
  auto s = span(n);
  if (!s) return "?:?";
  return std::to_string(s->line) + ":" + std::to_string(s->column);
}

} // namespace lfx
