#include "TestPrograms.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <limits>
#include <stdexcept>

using namespace lfx;
using namespace lfx::fixtures;

namespace {

RuleDescriptor probeDescriptor(const std::string& id) {
  RuleDescriptor d;
  d.id = id;
  d.title = id;
  d.message = id + " fired";
  d.category = "Test";
  d.severity = Severity::Warning;
  d.helpLink = helpLinkFor(id);
  return d;
}

// Reports every node of one syntax kind.
class KindProbe final : public Rule {
public:
  KindProbe(std::string id, NodeKind kind) : Descriptor(probeDescriptor(id)), Kind(kind) {}
  std::vector<RuleDescriptor> descriptors() const override { return {Descriptor}; }
  std::vector<Trigger> triggers() const override { return {Trigger::syntax(Kind)}; }
  void evaluate(const RuleContext& ctx) const override { ctx.report(Descriptor, ctx.node()); }

private:
  RuleDescriptor Descriptor;
  NodeKind Kind;
};

// Reports, then throws, at every object creation.
class ThrowingRule final : public Rule {
public:
  std::vector<RuleDescriptor> descriptors() const override { return {probeDescriptor("TEST90")}; }
  std::vector<Trigger> triggers() const override { return {Trigger::syntax(NodeKind::ObjectCreation)}; }
  void evaluate(const RuleContext& ctx) const override {
    ctx.report(probeDescriptor("TEST90"), ctx.node());
    throw std::runtime_error("probe exploded");
  }
};

// Throws at every node of every kind.
class ThrowEverywhereRule final : public Rule {
public:
  std::vector<RuleDescriptor> descriptors() const override { return {probeDescriptor("TEST91")}; }
  std::vector<Trigger> triggers() const override {
    std::vector<Trigger> out;
    for (size_t k = 0; k < static_cast<size_t>(NodeKind::Count_); ++k)
      out.push_back(Trigger::syntax(static_cast<NodeKind>(k)));
    return out;
  }
  void evaluate(const RuleContext&) const override { throw std::runtime_error("always"); }
};

// Raises the cancel flag once it has seen `limit` creations.
class CancellingRule final : public Rule {
public:
  CancellingRule(std::atomic<bool>& flag, int limit) : Flag(flag), Limit(limit) {}
  std::vector<RuleDescriptor> descriptors() const override { return {probeDescriptor("TEST80")}; }
  std::vector<Trigger> triggers() const override { return {Trigger::syntax(NodeKind::ObjectCreation)}; }
  void evaluate(const RuleContext& ctx) const override {
    ctx.report(probeDescriptor("TEST80"), ctx.node());
    if (++Seen >= Limit) Flag = true;
  }

private:
  std::atomic<bool>& Flag;
  int Limit;
  mutable std::atomic<int> Seen{0};
};

// One method holding a pattern for each builtin rule.
const char* const kEveryRuleProgram = R"lfx(
(declare-type "System.Collections.Concurrent.ConcurrentDictionary`2")
(declare-type "System.Collections.Concurrent.ConcurrentDictionary<string, int>"
              :definition "System.Collections.Concurrent.ConcurrentDictionary`2" :args ("string" "int"))
(declare-type "Libronix.Utility.DictionaryUtility")
(declare-member "Libronix.Utility.DictionaryUtility" "GetOrAddValue" :kind method :type "int")
(declare-type "Libronix.Utility.Threading.IWorkState")
(declare-type "Libronix.Utility.Threading.WorkState")
(declare-member "Libronix.Utility.Threading.WorkState" "None" :kind property
                :type "Libronix.Utility.Threading.IWorkState")
(declare-member "Libronix.Utility.Threading.WorkState" "ToDo" :kind property
                :type "Libronix.Utility.Threading.IWorkState")
(unit (using System.Collections.Generic)
  (class Worker
    (method Run (typename void)
      (params (param workState (typename IWorkState :type "Libronix.Utility.Threading.IWorkState")))
      (block
        (local list (typename var)
          (new :type "System.Collections.Generic.List<int>" (typename "List<int>") (args)))
        (expr-stmt (call (member :symbol "Libronix.Utility.DictionaryUtility::GetOrAddValue"
                           (id dict :type "System.Collections.Concurrent.ConcurrentDictionary<string, int>")
                           (id GetOrAddValue))
                         (args (str key))))
        (expr-stmt (call (id Use) (args (member :symbol "Libronix.Utility.Threading.WorkState::None"
                                          (id WorkState) (id None)))))
        (expr-stmt (call (id Print) (args (interp (interp-text "hello")))))
        (expr-stmt (call (id Print) (args (interp (interp-text "$") (interp-hole (id a))))))))))
)lfx";

std::string manyLists(int n) {
  std::string body;
  for (int i = 0; i < n; ++i) {
    auto name = "l" + std::to_string(i);
    body += listLocal(name, i % 2 ? newList("(args)") : newList("(init (num 1) (id x))"));
  }
  return listProgram(body);
}

} // namespace

TEST(RuleEngine, DispatchesInPreorderAndRuleRegistrationOrder) {
  RuleRegistry registry;
  registry.add(std::make_unique<KindProbe>("TEST01", NodeKind::ObjectCreation))
          .add(std::make_unique<KindProbe>("TEST02", NodeKind::ObjectCreation))
          .add(std::make_unique<KindProbe>("TEST03", NodeKind::LocalDeclaration));
  auto file = readTree(listProgram(listLocal("a", newList("(args)")) + listLocal("b", newList("(args)"))));

  auto result = analyzeWith(registry, file);
  ASSERT_EQ(result.findings.size(), 6u);
  std::vector<std::string> ids;
  for (const auto& f : result.findings) ids.push_back(f.ruleId);
  EXPECT_EQ(ids, (std::vector<std::string>{"TEST03", "TEST01", "TEST02", "TEST03", "TEST01", "TEST02"}));
  EXPECT_EQ(result.findings[1].span, result.findings[2].span);
  EXPECT_EQ(result.findings[1].message, "TEST01 fired");
  EXPECT_EQ(result.findings[1].severity, Severity::Warning);
  EXPECT_TRUE(result.faults.empty());
}

TEST(RuleEngine, FaultingRuleIsIsolated) {
  RuleRegistry registry;
  registry.add(std::make_unique<ThrowingRule>()).add(makeCollectionInitializationRule());
  auto file = readTree(listProgram(listLocal("list", newList("(args)"))), "Faulty.cs");

  std::string log;
  llvm::raw_string_ostream os(log);
  RuleEngine engine(registry, {}, &os);
  auto result = engine.analyze(*file.tree, *file.semantics);
  os.flush();

  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_EQ(result.findings[0].ruleId, "FL0021");
  ASSERT_EQ(result.faults.size(), 1u);
  EXPECT_EQ(result.faults[0].ruleId, "TEST90");
  EXPECT_EQ(result.faults[0].what, "probe exploded");
  EXPECT_EQ(result.faults[0].span.line, 9u);
  EXPECT_EQ(log, "lintfix: internal error: rule TEST90 failed at Faulty.cs:9:15: probe exploded\n");
}

TEST(RuleEngine, FaultingRuleLeavesEveryBuiltinRuleReporting) {
  RuleRegistry registry;
  registry.add(std::make_unique<ThrowEverywhereRule>())
          .add(makeCollectionInitializationRule())
          .add(makeConcurrentAccessorRule())
          .add(makeWorkStateSentinelRule())
          .add(makeInterpolatedStringRule());
  auto file = readTree(std::string(listPrelude()) + kEveryRuleProgram, "Worker.cs");

  auto result = analyzeWith(registry, file);
  std::vector<std::string> ids;
  for (const auto& f : result.findings) ids.push_back(f.ruleId);
  std::sort(ids.begin(), ids.end());
  EXPECT_EQ(ids, (std::vector<std::string>{"FL0007", "FL0008", "FL0011", "FL0014", "FL0021"}));

  // Without the faulting rule the same findings come out in the same order.
  auto clean = analyzeWith(RuleRegistry::withBuiltinRules(), file);
  ASSERT_EQ(clean.findings.size(), result.findings.size());
  for (size_t i = 0; i < clean.findings.size(); ++i) {
    EXPECT_EQ(result.findings[i].ruleId, clean.findings[i].ruleId);
    EXPECT_EQ(result.findings[i].span, clean.findings[i].span);
  }

  EXPECT_EQ(result.faults.size(), file.tree->preorder().size());
  for (const auto& fault : result.faults) EXPECT_EQ(fault.ruleId, "TEST91");
}

TEST(RuleEngine, EnableAndDisableSelectRules) {
  auto registry = RuleRegistry::withBuiltinRules();

  AnalyzeOptions disabled;
  disabled.disabledRules = {"FL0021"};
  RuleEngine without(registry, disabled, &llvm::nulls());
  for (const auto& d : without.supportedRules()) EXPECT_NE(d.id, "FL0021");
  EXPECT_EQ(without.supportedRules().size(), registry.supportedRules().size() - 1);

  auto file = readTree(listProgram(listLocal("list", newList("(args)"))));
  EXPECT_TRUE(analyzeWith(registry, file, disabled).findings.empty());

  AnalyzeOptions only;
  only.enabledRules = {"FL0021"};
  RuleEngine with(registry, only, &llvm::nulls());
  ASSERT_EQ(with.supportedRules().size(), 1u);
  EXPECT_EQ(with.supportedRules()[0].id, "FL0021");
  EXPECT_EQ(analyzeWith(registry, file, only).findings.size(), 1u);
}

TEST(RuleEngine, RegistryRejectsDuplicateIds) {
  RuleRegistry registry;
  registry.add(std::make_unique<KindProbe>("TEST01", NodeKind::Block));
  EXPECT_THROW(registry.add(std::make_unique<KindProbe>("TEST01", NodeKind::Invocation)),
               std::invalid_argument);
  EXPECT_THROW(registry.add(nullptr), std::invalid_argument);
  EXPECT_EQ(registry.rules().size(), 1u);
  EXPECT_EQ(registry.supportedRules().size(), 1u);
  ASSERT_NE(registry.find("TEST01"), nullptr);
  EXPECT_EQ(registry.find("TEST02"), nullptr);
}

TEST(RuleEngine, BuiltinRulesAreDescribed) {
  auto registry = RuleRegistry::withBuiltinRules();
  std::vector<std::string> ids;
  for (const auto& d : registry.supportedRules()) {
    ids.push_back(d.id);
    EXPECT_EQ(d.helpLink, "https://github.com/Faithlife/FaithlifeAnalyzers/wiki/" + d.id);
    EXPECT_FALSE(d.message.empty());
  }
  EXPECT_EQ(ids, (std::vector<std::string>{"FL0021", "FL0011", "FL0008", "FL0007", "FL0014"}));
}

TEST(RuleEngine, ParallelPassMatchesSequential) {
  auto registry = RuleRegistry::withBuiltinRules();
  auto file = readTree(manyLists(40));

  auto sequential = analyzeWith(registry, file);
  AnalyzeOptions opts;
  opts.jobs = 4;
  auto parallel = analyzeWith(registry, file, opts);

  ASSERT_EQ(sequential.findings.size(), 40u);
  ASSERT_EQ(parallel.findings.size(), sequential.findings.size());
  for (size_t i = 0; i < sequential.findings.size(); ++i) {
    EXPECT_EQ(parallel.findings[i].ruleId, sequential.findings[i].ruleId);
    EXPECT_EQ(parallel.findings[i].span, sequential.findings[i].span);
  }
  EXPECT_FALSE(parallel.cancelled);
}

TEST(RuleEngine, OversizedJobCountRunsToCompletion) {
  auto registry = RuleRegistry::withBuiltinRules();
  auto file = readTree(listProgram(listLocal("list", newList("(args)"))));

  AnalyzeOptions opts;
  opts.jobs = 0x80000000u;
  auto result = analyzeWith(registry, file, opts);
  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_EQ(result.findings[0].ruleId, "FL0021");
  EXPECT_FALSE(result.cancelled);

  opts.jobs = std::numeric_limits<unsigned>::max();
  EXPECT_EQ(analyzeWith(registry, file, opts).findings.size(), 1u);
}

TEST(RuleEngine, CancellationYieldsPrefix) {
  std::atomic<bool> cancel{true};
  AnalyzeOptions opts;
  opts.cancel = &cancel;
  auto registry = RuleRegistry::withBuiltinRules();
  auto file = readTree(manyLists(4));

  auto early = analyzeWith(registry, file, opts);
  EXPECT_TRUE(early.cancelled);
  EXPECT_TRUE(early.findings.empty());

  cancel = false;
  RuleRegistry probing;
  probing.add(std::make_unique<CancellingRule>(cancel, 2));
  auto partial = analyzeWith(probing, file, opts);
  EXPECT_TRUE(partial.cancelled);
  ASSERT_EQ(partial.findings.size(), 2u);
  EXPECT_LT(partial.findings[0].span.start, partial.findings[1].span.start);
}

TEST(RuleEngine, SkipsGeneratedSources) {
  EXPECT_TRUE(RuleEngine::isGeneratedPath("Views/Main.g.cs"));
  EXPECT_TRUE(RuleEngine::isGeneratedPath("Api.generated.cs"));
  EXPECT_TRUE(RuleEngine::isGeneratedPath("Form1.Designer.cs"));
  EXPECT_FALSE(RuleEngine::isGeneratedPath("Program.cs"));

  auto registry = RuleRegistry::withBuiltinRules();
  auto file = readTree(listProgram(listLocal("list", newList("(args)"))), "Resources.designer.cs");

  auto skipped = analyzeWith(registry, file);
  EXPECT_TRUE(skipped.skippedGenerated);
  EXPECT_TRUE(skipped.findings.empty());

  AnalyzeOptions opts;
  opts.analyzeGeneratedCode = true;
  auto analyzed = analyzeWith(registry, file, opts);
  EXPECT_FALSE(analyzed.skippedGenerated);
  ASSERT_EQ(analyzed.findings.size(), 1u);
  EXPECT_EQ(analyzed.findings[0].file, "Resources.designer.cs");
}

TEST(RuleEngine, OperationSubscribersFollowBindings) {
  RuleRegistry registry;
  class CreationOperationProbe final : public Rule {
  public:
    std::vector<RuleDescriptor> descriptors() const override { return {probeDescriptor("TEST70")}; }
    std::vector<Trigger> triggers() const override {
      return {Trigger::operation(OperationKind::ObjectCreation)};
    }
    void evaluate(const RuleContext& ctx) const override {
      ctx.report(probeDescriptor("TEST70"), ctx.node());
    }
  };
  registry.add(std::make_unique<CreationOperationProbe>());

  // The second creation has no bound type and is no operation.
  auto file = readTree(listProgram(listLocal("a", newList("(args)")) +
                                   listLocal("b", "(new (typename Unknown) (args))")));
  auto result = analyzeWith(registry, file);
  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_EQ(result.findings[0].span.line, 9u);
}

TEST(SymbolResolver, MissesAreNeverEqual) {
  TypeDescriptor t;
  EXPECT_FALSE(SymbolResolver::equals(nullptr, nullptr));
  EXPECT_FALSE(SymbolResolver::equals(&t, nullptr));
  EXPECT_TRUE(SymbolResolver::equals(&t, &t));
}
