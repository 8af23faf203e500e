#pragma once
#include "analyzers/Analyzer.hpp"
#include "analyzers/Finding.hpp"
#include "syntax/SyntaxTree.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lfx {

struct CodeFixContext {
  const Finding& finding;
  const SyntaxTree& tree;           // the tree the finding was reported on
  const LanguageOptions& language;
};

// Offers fixes for findings of the rule ids it declares. A provider that
// cannot fix a finding (unsupported language version, node not found)
// simply registers nothing.
class CodeFixProvider {
public:
  virtual ~CodeFixProvider() = default;
  virtual std::vector<std::string> fixableRuleIds() const = 0;
  virtual void registerFixes(const CodeFixContext& ctx, std::vector<FixProposal>& out) const = 0;
};

std::unique_ptr<CodeFixProvider> makeCollectionInitializationFix();

class CodeFixService {
public:
  explicit CodeFixService(LanguageOptions language = {}) : Language(language) {}

  CodeFixService& add(std::unique_ptr<CodeFixProvider> provider);
  static CodeFixService withBuiltinFixes(LanguageOptions language = {});

  std::vector<FixProposal> proposedFixes(const Finding& finding, const SyntaxTree& tree) const;
  // Fills Finding::fixes for every finding.
  void attachFixes(std::vector<Finding>& findings, const SyntaxTree& tree) const;

  const LanguageOptions& language() const { return Language; }

private:
  LanguageOptions Language;
  std::vector<std::unique_ptr<CodeFixProvider>> Providers;
};

} // namespace lfx
