#pragma once
#include "analyzers/Finding.hpp"
#include "syntax/SyntaxTree.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lfx {

struct BatchResult {
  SyntaxTree tree;
  std::vector<const FixProposal*> applied;
  std::vector<const FixProposal*> skipped;  // conflicting or stale, in source order
};

// Applies fix proposals to a tree. Trees are never modified; every apply
// returns a new one, re-rendered (whitespace normalised) and with the
// replacement simplified.
class RefactorEngine {
public:
  // std::nullopt if the proposal no longer applies to `tree`.
  static std::optional<SyntaxTree> applyOne(const SyntaxTree& tree, const FixProposal& fix,
                                            std::string* error = nullptr);

  // Non-overlapping proposals in one rewrite. Proposals are taken in source
  // order; one that overlaps an earlier accepted span is skipped.
  static BatchResult applyAll(const SyntaxTree& tree, const std::vector<FixProposal>& fixes);

private:
  static NodePtr replacementFor(const SyntaxTree& tree, const FixProposal& fix, std::string* error);
};

} // namespace lfx
