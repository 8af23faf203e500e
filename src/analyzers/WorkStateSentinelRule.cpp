#include "analyzers/Analyzer.hpp"

namespace lfx {

namespace {

const char* const kRuleId = "FL0008";
const char* const kWorkState = "Libronix.Utility.Threading.WorkState";
const char* const kIWorkState = "Libronix.Utility.Threading.IWorkState";
const char* const kAsyncMethodContext = "Libronix.Utility.Threading.AsyncMethodContext";
const char* const kAsyncAction = "Libronix.Utility.Threading.AsyncAction";
const char* const kCancellationToken = "System.Threading.CancellationToken";
const char* const kEnumerable = "System.Collections.Generic.IEnumerable`1";

// The one member named `name`, or null when absent or overloaded.
const Symbol* soleMember(const TypeDescriptor& type, const char* name) {
  auto found = type.findMembers(name);
  return found.size() == 1 ? found.front() : nullptr;
}

class WorkStateSentinelRule final : public Rule {
public:
  std::vector<RuleDescriptor> descriptors() const override { return {descriptor()}; }

  std::vector<Trigger> triggers() const override {
    return {Trigger::operation(OperationKind::PropertyReference)};
  }

  void evaluate(const RuleContext& ctx) const override {
    const auto& resolver = ctx.resolver();
    auto* iworkState = resolver.lookupType(kIWorkState);
    auto* workState = resolver.lookupType(kWorkState);
    if (!iworkState || !workState) return;

    auto* none = soleMember(*workState, "None");
    auto* toDo = soleMember(*workState, "ToDo");
    if (!none || !toDo) return;

    auto* property = resolver.resolveSymbol(ctx.node());
    if (property != none && property != toDo) return;

    auto* method = ctx.tree().firstAncestor(ctx.node(), NodeKind::MethodDecl);
    if (!method) return;

    if (returnsAsyncActions(*method, resolver) ||
        hasWorkStateParameter(*method, resolver, *iworkState))
      ctx.report(descriptor(), ctx.node());
  }

private:
  // IEnumerable<AsyncAction> iterators always run with a work state.
  static bool returnsAsyncActions(const SyntaxNode& method, const SymbolResolver& resolver) {
    auto* ret = method.childOfKind(NodeKind::TypeName);
    auto* type = ret ? resolver.typeOf(*ret) : nullptr;
    if (!type || !type->definition || type->typeArguments.empty()) return false;
    return SymbolResolver::equals(type->definition, resolver.lookupType(kEnumerable)) &&
           SymbolResolver::equals(type->typeArguments[0], resolver.lookupType(kAsyncAction));
  }

  static bool hasWorkStateParameter(const SyntaxNode& method, const SymbolResolver& resolver,
                                    const TypeDescriptor& iworkState) {
    auto* params = method.childOfKind(NodeKind::ParameterList);
    if (!params) return false;
    auto* cancellationToken = resolver.lookupType(kCancellationToken);
    auto* asyncMethodContext = resolver.lookupType(kAsyncMethodContext);

    for (const auto& p : params->children) {
      if (!p) continue;
      auto* typeNode = p->childOfKind(NodeKind::TypeName);
      auto* type = typeNode ? resolver.typeOf(*typeNode) : nullptr;
      if (!type) continue;
      if (type == &iworkState || SymbolResolver::equals(type, cancellationToken) ||
          SymbolResolver::equals(type, asyncMethodContext))
        return true;
      if (type->implements(iworkState)) return true;
    }
    return false;
  }

  static const RuleDescriptor& descriptor() {
    static const RuleDescriptor d{
      kRuleId,
      "WorkState.None and WorkState.ToDo Usage",
      "WorkState.None and WorkState.ToDo must not be used when an IWorkState is available.",
      "Usage",
      Severity::Error,
      true,
      helpLinkFor(kRuleId),
    };
    return d;
  }
};

} // namespace

std::unique_ptr<Rule> makeWorkStateSentinelRule() {
  return std::make_unique<WorkStateSentinelRule>();
}

} // namespace lfx
