#pragma once
#include "semantics/SymbolResolver.hpp"

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lfx {

// In-memory resolver: a type universe plus node bindings. Built once per
// analysis input and read-only afterwards, so concurrent queries are safe.
class SemanticIndex final : public SymbolResolver {
public:
  SemanticIndex() = default;
  SemanticIndex(const SemanticIndex&) = delete;
  SemanticIndex& operator=(const SemanticIndex&) = delete;

  // Get-or-create a type by canonical name.
  TypeDescriptor& declareType(const std::string& name);
  // Constructed generic, e.g. "System.Collections.Generic.List<int>" from List`1.
  TypeDescriptor& declareConstructed(const std::string& name, const TypeDescriptor& definition,
                                     std::vector<const TypeDescriptor*> args);
  Symbol& declareMember(TypeDescriptor& owner, const std::string& name, SymbolKind kind,
                        const TypeDescriptor* type = nullptr);

  void bindSymbol(const SyntaxNode& node, const Symbol& sym) { Symbols[&node] = &sym; }
  void bindType(const SyntaxNode& node, const TypeDescriptor& type) { Types[&node] = &type; }

  // "Owner.Type::Member" lookup, first match.
  const Symbol* findMember(const std::string& qualified) const;

  const Symbol* resolveSymbol(const SyntaxNode& node) const override;
  const TypeDescriptor* typeOf(const SyntaxNode& expression) const override;
  const TypeDescriptor* lookupType(const std::string& canonicalName) const override;
  std::optional<OperationKind> operationOf(const SyntaxNode& node) const override;

private:
  std::map<std::string, std::unique_ptr<TypeDescriptor>> Universe;
  std::vector<std::unique_ptr<Symbol>> SymbolStore;
  std::unordered_map<const SyntaxNode*, const Symbol*> Symbols;
  std::unordered_map<const SyntaxNode*, const TypeDescriptor*> Types;
};

} // namespace lfx
