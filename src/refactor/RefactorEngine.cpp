#include "refactor/RefactorEngine.hpp"
#include "refactor/Simplifier.hpp"

#include <algorithm>
#include <numeric>

namespace lfx {

NodePtr RefactorEngine::replacementFor(const SyntaxTree& tree, const FixProposal& fix,
                                       std::string* error) {
  if (!fix.target || !tree.contains(*fix.target)) {
    if (error) *error = "Fix '" + fix.title + "' targets a node that is not in the tree";
    return nullptr;
  }
  if (!fix.rewrite) {
    if (error) *error = "Fix '" + fix.title + "' has no rewrite";
    return nullptr;
  }
  auto replacement = fix.rewrite(tree, *fix.target);
  if (!replacement) {
    if (error) *error = "Fix '" + fix.title + "' produced no replacement";
    return nullptr;
  }
  return Simplifier::reduce(replacement);
}

std::optional<SyntaxTree> RefactorEngine::applyOne(const SyntaxTree& tree, const FixProposal& fix,
                                                   std::string* error) {
  auto replacement = replacementFor(tree, fix, error);
  if (!replacement) return std::nullopt;
  return tree.replaceNode(*fix.target, std::move(replacement));
}

BatchResult RefactorEngine::applyAll(const SyntaxTree& tree, const std::vector<FixProposal>& fixes) {
  // source order; equal starts keep their input order
  std::vector<size_t> order(fixes.size());
  std::iota(order.begin(), order.end(), 0);
  auto startOf = [&](size_t i) {
    const auto& f = fixes[i];
    auto s = f.target ? tree.span(*f.target) : std::nullopt;
    return s ? s->start : f.span.start;
  };
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return startOf(a) < startOf(b); });

  std::vector<NodeEdit> edits;
  std::vector<Span> taken;
  std::vector<const FixProposal*> applied, skipped;

  for (size_t i : order) {
    const auto& fix = fixes[i];
    auto span = fix.target ? tree.span(*fix.target) : std::nullopt;
    bool conflict = !span || std::any_of(taken.begin(), taken.end(),
                                         [&](const Span& s) { return s.overlaps(*span) || s == *span; });
    NodePtr replacement = conflict ? nullptr : replacementFor(tree, fix, nullptr);
    if (!replacement) {
      skipped.push_back(&fix);
      continue;
    }
    taken.push_back(*span);
    edits.emplace_back(fix.target.get(), std::move(replacement));
    applied.push_back(&fix);
  }

  if (edits.empty()) return BatchResult{tree, std::move(applied), std::move(skipped)};
  return BatchResult{tree.replaceNodes(edits), std::move(applied), std::move(skipped)};
}

} // namespace lfx
