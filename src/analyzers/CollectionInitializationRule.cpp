#include "analyzers/Analyzer.hpp"
#include "analyzers/CollectionInitialization.hpp"

#include <algorithm>
#include <array>
#include <string_view>

namespace lfx {

namespace collection_init {

const char* const kRuleId = "FL0021";
const char* const kListDefinition = "System.Collections.Generic.List`1";

bool isListCreation(const SyntaxNode& creation, const SymbolResolver& resolver) {
  auto* type = resolver.typeOf(creation);
  if (!type) return false;
  return SymbolResolver::equals(&type->constructedFrom(), resolver.lookupType(kListDefinition));
}

// Literals, names and `a.b` only.
static bool isSimpleExpression(const SyntaxNode& e) {
  switch (e.kind) {
  case NodeKind::NumericLiteral:
  case NodeKind::StringLiteral:
  case NodeKind::TrueLiteral:
  case NodeKind::FalseLiteral:
  case NodeKind::IdentifierName:
  case NodeKind::MemberAccess:
    return true;
  default:
    return false;
  }
}

bool isSimpleInitializer(const SyntaxNode& initializer) {
  return initializer.children.size() <= kMaxInitializerElements &&
         std::all_of(initializer.children.begin(), initializer.children.end(),
                     [](const NodePtr& e) { return e && isSimpleExpression(*e); });
}

bool isDeferredChain(const SyntaxNode& expression) {
  static constexpr std::array<std::string_view, 15> kChainNames = {
    "Where", "Select", "SelectMany", "OrderBy", "OrderByDescending",
    "GroupBy", "Join", "Skip", "Take", "Distinct", "Union", "Intersect",
    "Except", "Zip", "DefaultIfEmpty",
  };
  if (!expression.is(NodeKind::Invocation)) return false;
  auto* callee = expression.child(0);
  if (!callee || !callee->is(NodeKind::MemberAccess)) return false;
  auto* name = callee->child(1);
  if (!name) return false;
  // Matched by name only; the method's origin is not checked.
  return std::find(kChainNames.begin(), kChainNames.end(), name->text) != kChainNames.end();
}

Shape classify(const SyntaxNode& creation) {
  auto* args = creation.childOfKind(NodeKind::ArgumentList);
  auto* init = creation.childOfKind(NodeKind::InitializerList);
  size_t argc = args ? args->children.size() : 0;

  if (argc == 0 && !init) return Shape::Empty;
  if (init) return isSimpleInitializer(*init) ? Shape::Elements : Shape::None;
  if (argc == 1) {
    auto* arg = args->child(0);
    return arg && !isDeferredChain(*arg) ? Shape::Spread : Shape::None;
  }
  return Shape::None;
}

} // namespace collection_init

namespace {

class CollectionInitializationRule final : public Rule {
public:
  std::vector<RuleDescriptor> descriptors() const override { return {descriptor()}; }

  std::vector<Trigger> triggers() const override {
    return {Trigger::syntax(NodeKind::ObjectCreation)};
  }

  void evaluate(const RuleContext& ctx) const override {
    const auto& creation = ctx.node();
    if (!collection_init::isListCreation(creation, ctx.resolver())) return;
    if (collection_init::classify(creation) == collection_init::Shape::None) return;
    ctx.report(descriptor(), creation);
  }

private:
  static const RuleDescriptor& descriptor() {
    static const RuleDescriptor d{
      collection_init::kRuleId,
      "Use collection expression",
      "Use collection expression instead of explicit collection creation",
      "Style",
      Severity::Info,
      true,
      helpLinkFor(collection_init::kRuleId),
    };
    return d;
  }
};

} // namespace

std::unique_ptr<Rule> makeCollectionInitializationRule() {
  return std::make_unique<CollectionInitializationRule>();
}

} // namespace lfx
