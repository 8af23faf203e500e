#pragma once
#include "analyzers/Finding.hpp"
#include "semantics/SymbolResolver.hpp"
#include "syntax/SyntaxTree.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace lfx {

struct AnalyzeOptions {
  std::vector<std::string> enabledRules;   // if set, only these ids run
  std::vector<std::string> disabledRules;
  unsigned jobs = 1;                       // >1 evaluates node chunks on a thread pool
  bool analyzeGeneratedCode = false;
  const std::atomic<bool>* cancel = nullptr; // checked at every node boundary
};

// Target language configuration; decides which fixes may be offered.
struct LanguageOptions {
  static constexpr unsigned kCollectionExpressionsVersion = 12;

  unsigned languageVersion = 12;
  bool supportsCollectionExpressions() const {
    return languageVersion >= kCollectionExpressionsVersion;
  }
};

// What a rule subscribes to: a syntax node kind or a semantic operation kind.
struct Trigger {
  enum class Domain { Syntax, Operation };
  Domain domain = Domain::Syntax;
  unsigned kind = 0;

  static Trigger syntax(NodeKind k) { return {Domain::Syntax, static_cast<unsigned>(k)}; }
  static Trigger operation(OperationKind k) { return {Domain::Operation, static_cast<unsigned>(k)}; }
};

// Everything a rule sees while evaluating one node.
class RuleContext {
public:
  RuleContext(const SyntaxTree& tree, const SymbolResolver& resolver,
              const SyntaxNode& node, std::vector<Finding>& out)
    : Tree(tree), Resolver(resolver), Node(node), Out(out) {}

  const SyntaxTree& tree() const { return Tree; }
  const SymbolResolver& resolver() const { return Resolver; }
  const SyntaxNode& node() const { return Node; }

  // Reports `d` at `at` with the descriptor's message and severity.
  void report(const RuleDescriptor& d, const SyntaxNode& at) const;

private:
  const SyntaxTree& Tree;
  const SymbolResolver& Resolver;
  const SyntaxNode& Node;
  std::vector<Finding>& Out;
};

// A rule is stateless after construction; evaluate may run on several
// threads at once.
class Rule {
public:
  virtual ~Rule() = default;
  virtual std::vector<RuleDescriptor> descriptors() const = 0;
  virtual std::vector<Trigger> triggers() const = 0;
  virtual void evaluate(const RuleContext& ctx) const = 0;
};

std::unique_ptr<Rule> makeCollectionInitializationRule();
std::unique_ptr<Rule> makeConcurrentAccessorRule();
std::unique_ptr<Rule> makeWorkStateSentinelRule();
std::unique_ptr<Rule> makeInterpolatedStringRule();

} // namespace lfx
