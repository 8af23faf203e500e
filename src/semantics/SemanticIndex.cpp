#include "semantics/SemanticIndex.hpp"

#include <algorithm>

namespace lfx {

std::vector<const Symbol*> TypeDescriptor::findMembers(const std::string& memberName) const {
  std::vector<const Symbol*> out;
  for (auto* m : members)
    if (m->name == memberName) out.push_back(m);
  return out;
}

bool TypeDescriptor::implements(const TypeDescriptor& iface) const {
  for (auto* i : interfaces)
    if (i == &iface || i->implements(iface)) return true;
  return definition && definition->implements(iface);
}

TypeDescriptor& SemanticIndex::declareType(const std::string& name) {
  auto& slot = Universe[name];
  if (!slot) {
    slot = std::make_unique<TypeDescriptor>();
    slot->name = name;
  }
  return *slot;
}

TypeDescriptor& SemanticIndex::declareConstructed(const std::string& name,
                                                  const TypeDescriptor& definition,
                                                  std::vector<const TypeDescriptor*> args) {
  auto& t = declareType(name);
  t.definition = &definition;
  t.typeArguments = std::move(args);
  return t;
}

Symbol& SemanticIndex::declareMember(TypeDescriptor& owner, const std::string& name,
                                     SymbolKind kind, const TypeDescriptor* type) {
  auto sym = std::make_unique<Symbol>();
  sym->kind = kind;
  sym->name = name;
  sym->containingType = &owner;
  sym->type = type;
  owner.members.push_back(sym.get());
  SymbolStore.push_back(std::move(sym));
  return *SymbolStore.back();
}

const Symbol* SemanticIndex::findMember(const std::string& qualified) const {
  auto sep = qualified.rfind("::");
  if (sep == std::string::npos) return nullptr;
  auto* owner = lookupType(qualified.substr(0, sep));
  if (!owner) return nullptr;
  auto found = owner->findMembers(qualified.substr(sep + 2));
  return found.empty() ? nullptr : found.front();
}

const Symbol* SemanticIndex::resolveSymbol(const SyntaxNode& node) const {
  auto it = Symbols.find(&node);
  return it == Symbols.end() ? nullptr : it->second;
}

const TypeDescriptor* SemanticIndex::typeOf(const SyntaxNode& expression) const {
  auto it = Types.find(&expression);
  if (it != Types.end()) return it->second;
  // Fall back to the declared type of whatever the expression names.
  if (auto* sym = resolveSymbol(expression))
    if (sym->kind != SymbolKind::Method && sym->kind != SymbolKind::Constructor) return sym->type;
  return nullptr;
}

const TypeDescriptor* SemanticIndex::lookupType(const std::string& canonicalName) const {
  auto it = Universe.find(canonicalName);
  return it == Universe.end() ? nullptr : it->second.get();
}

std::optional<OperationKind> SemanticIndex::operationOf(const SyntaxNode& node) const {
  switch (node.kind) {
  case NodeKind::InterpolatedString:
    return OperationKind::InterpolatedString;
  case NodeKind::ObjectCreation:
    if (typeOf(node)) return OperationKind::ObjectCreation;
    return std::nullopt;
  case NodeKind::Invocation:
    if (auto* callee = node.child(0))
      if (auto* sym = resolveSymbol(*callee); sym && sym->kind == SymbolKind::Method)
        return OperationKind::Invocation;
    return std::nullopt;
  case NodeKind::MemberAccess:
  case NodeKind::IdentifierName:
    if (auto* sym = resolveSymbol(node)) {
      if (sym->kind == SymbolKind::Property) return OperationKind::PropertyReference;
      if (sym->kind == SymbolKind::Field) return OperationKind::FieldReference;
    }
    return std::nullopt;
  default:
    return std::nullopt;
  }
}

} // namespace lfx
