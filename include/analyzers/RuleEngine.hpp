#pragma once
#include "analyzers/Analyzer.hpp"
#include "analyzers/RuleRegistry.hpp"

#include <array>
#include <string>
#include <unordered_set>
#include <vector>

namespace llvm {
class raw_ostream;
}

namespace lfx {

struct AnalysisResult {
  std::vector<Finding> findings;   // pre-order, left to right
  std::vector<EngineFault> faults;
  bool cancelled = false;
  bool skippedGenerated = false;
};

// Routes every node of a tree to the rules subscribed to its syntax kind and
// to its semantic operation kind. Subscriptions are resolved once, at
// construction; a pass is a single pre-order walk.
class RuleEngine {
public:
  // `log` receives internal rule faults; pass llvm::nulls() to silence.
  RuleEngine(const RuleRegistry& registry, AnalyzeOptions opts = {},
             llvm::raw_ostream* log = nullptr);

  // Descriptors of the rules active in this engine.
  std::vector<RuleDescriptor> supportedRules() const;

  AnalysisResult analyze(const SyntaxTree& tree, const SymbolResolver& resolver) const;

  static bool isGeneratedPath(const std::string& path);

private:
  using Subscribers = std::vector<const Rule*>;

  bool isActive(const std::string& id) const { return ActiveIds.count(id) != 0; }
  void visit(const SyntaxTree& tree, const SymbolResolver& resolver, const SyntaxNode& node,
             std::vector<Finding>& out, std::vector<EngineFault>& faults) const;
  void runRule(const Rule& rule, const SyntaxTree& tree, const SymbolResolver& resolver,
               const SyntaxNode& node, std::vector<Finding>& out,
               std::vector<EngineFault>& faults) const;

  const RuleRegistry& Registry;
  AnalyzeOptions Opts;
  llvm::raw_ostream* Log;
  std::unordered_set<std::string> ActiveIds;
  std::array<Subscribers, static_cast<size_t>(NodeKind::Count_)> BySyntax;
  std::array<Subscribers, static_cast<size_t>(OperationKind::Count_)> ByOperation;
};

} // namespace lfx
