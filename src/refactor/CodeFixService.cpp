#include "refactor/CodeFix.hpp"

#include <algorithm>
#include <stdexcept>

namespace lfx {

CodeFixService& CodeFixService::add(std::unique_ptr<CodeFixProvider> provider) {
  if (!provider) throw std::invalid_argument("CodeFixService::add: null provider");
  Providers.push_back(std::move(provider));
  return *this;
}

CodeFixService CodeFixService::withBuiltinFixes(LanguageOptions language) {
  CodeFixService s(language);
  s.add(makeCollectionInitializationFix());
  return s;
}

std::vector<FixProposal> CodeFixService::proposedFixes(const Finding& finding,
                                                       const SyntaxTree& tree) const {
  std::vector<FixProposal> out;
  CodeFixContext ctx{finding, tree, Language};
  for (const auto& p : Providers) {
    auto ids = p->fixableRuleIds();
    if (std::find(ids.begin(), ids.end(), finding.ruleId) != ids.end())
      p->registerFixes(ctx, out);
  }
  return out;
}

void CodeFixService::attachFixes(std::vector<Finding>& findings, const SyntaxTree& tree) const {
  for (auto& f : findings) f.fixes = proposedFixes(f, tree);
}

} // namespace lfx
