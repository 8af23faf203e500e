#include "analyzers/CollectionInitialization.hpp"
#include "refactor/CodeFix.hpp"

namespace lfx {

namespace {

const char* const kTitle = "Use collection expression";
const char* const kEquivalenceKey = "use-collection-expression";

// new List<T> { a, b } -> [a, b]; new List<T>(src) -> [..src]; new List<T>() -> []
NodePtr toCollectionLiteral(const SyntaxTree&, const SyntaxNode& creation) {
  std::vector<NodePtr> elements;
  auto* args = creation.childOfKind(NodeKind::ArgumentList);
  if (auto* init = creation.childOfKind(NodeKind::InitializerList)) {
    elements = init->children;
  } else if (args && args->children.size() == 1) {
    elements.push_back(spreadElement(args->children[0]));
  }
  return collectionLiteral(std::move(elements));
}

class CollectionInitializationFix final : public CodeFixProvider {
public:
  std::vector<std::string> fixableRuleIds() const override { return {collection_init::kRuleId}; }

  void registerFixes(const CodeFixContext& ctx, std::vector<FixProposal>& out) const override {
    auto* node = ctx.tree.findNode(ctx.finding.span);
    if (!node) return;
    auto* creation = ctx.tree.firstAncestorOrSelf(*node, NodeKind::ObjectCreation);
    if (!creation) return;

    // The finding stands even when the target language has no literal syntax.
    if (!ctx.language.supportsCollectionExpressions()) return;

    FixProposal fix;
    fix.ruleId = ctx.finding.ruleId;
    fix.title = kTitle;
    fix.equivalenceKey = kEquivalenceKey;
    fix.target = ctx.tree.share(*creation);
    fix.span = ctx.tree.span(*creation).value_or(ctx.finding.span);
    fix.rewrite = toCollectionLiteral;
    out.push_back(std::move(fix));
  }
};

} // namespace

std::unique_ptr<CodeFixProvider> makeCollectionInitializationFix() {
  return std::make_unique<CollectionInitializationFix>();
}

} // namespace lfx
