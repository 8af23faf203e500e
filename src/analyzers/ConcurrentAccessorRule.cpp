#include "analyzers/Analyzer.hpp"

namespace lfx {

namespace {

const char* const kRuleId = "FL0011";
const char* const kUtilityType = "Libronix.Utility.DictionaryUtility";
const char* const kConcurrentMap = "System.Collections.Concurrent.ConcurrentDictionary`2";
const char* const kMethodName = "GetOrAddValue";

// Flags DictionaryUtility.GetOrAddValue on a ConcurrentDictionary receiver,
// for both `d.GetOrAddValue(...)` and `d?.GetOrAddValue(...)`.
class ConcurrentAccessorRule final : public Rule {
public:
  std::vector<RuleDescriptor> descriptors() const override { return {descriptor()}; }

  std::vector<Trigger> triggers() const override {
    return {Trigger::syntax(NodeKind::Invocation)};
  }

  void evaluate(const RuleContext& ctx) const override {
    const auto& call = ctx.node();
    const auto& resolver = ctx.resolver();
    auto* callee = call.child(0);
    if (!callee) return;

    const SyntaxNode* name = nullptr;
    if (callee->is(NodeKind::MemberAccess)) name = callee->child(1);
    else if (callee->is(NodeKind::MemberBinding)) name = callee->child(0);
    if (!name || name->text != kMethodName) return;

    auto* method = resolver.resolveSymbol(*callee);
    if (!method || method->kind != SymbolKind::Method) return;
    if (!SymbolResolver::equals(method->containingType, resolver.lookupType(kUtilityType))) return;

    const SyntaxNode* receiver = nullptr;
    if (callee->is(NodeKind::MemberAccess)) {
      receiver = callee->child(0);
    } else if (auto* access = ctx.tree().parent(call);
               access && access->is(NodeKind::ConditionalAccess) && access->child(1) == &call) {
      receiver = access->child(0);
    }
    if (!receiver) return;

    auto* type = resolver.typeOf(*receiver);
    if (!type || !SymbolResolver::equals(&type->constructedFrom(), resolver.lookupType(kConcurrentMap)))
      return;

    ctx.report(descriptor(), *name);
  }

private:
  static const RuleDescriptor& descriptor() {
    static const RuleDescriptor d{
      kRuleId,
      "GetOrAddValue() Usage",
      "GetOrAddValue() is not threadsafe and should not be used with ConcurrentDictionary; "
      "use GetOrAdd() instead.",
      "Usage",
      Severity::Warning,
      true,
      helpLinkFor(kRuleId),
    };
    return d;
  }
};

} // namespace

std::unique_ptr<Rule> makeConcurrentAccessorRule() {
  return std::make_unique<ConcurrentAccessorRule>();
}

} // namespace lfx
