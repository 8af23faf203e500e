#pragma once
#include "syntax/SyntaxNode.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lfx {

struct Symbol;

// A type of the analysed program's type universe. Descriptors are compared
// by identity; a constructed generic points at its definition.
struct TypeDescriptor {
  std::string name;                                 // canonical metadata name
  const TypeDescriptor* definition = nullptr;       // generic definition, null if not constructed
  std::vector<const TypeDescriptor*> typeArguments;
  std::vector<const TypeDescriptor*> interfaces;    // directly implemented
  std::vector<const Symbol*> members;

  const TypeDescriptor& constructedFrom() const { return definition ? *definition : *this; }
  std::vector<const Symbol*> findMembers(const std::string& memberName) const;
  // Transitive interface check, through definitions as well.
  bool implements(const TypeDescriptor& iface) const;
};

enum class SymbolKind : std::uint8_t { Method, Property, Field, Constructor, Local, Parameter };

struct Symbol {
  SymbolKind kind = SymbolKind::Method;
  std::string name;
  const TypeDescriptor* containingType = nullptr;
  const TypeDescriptor* type = nullptr;             // property/field/local type or method return
};

// Semantic operations a syntax node may stand for.
enum class OperationKind : std::uint8_t {
  PropertyReference,
  FieldReference,
  Invocation,
  ObjectCreation,
  InterpolatedString,
  Count_
};

// Point queries against the compiled program. A null / empty result is a
// resolution miss and never an error.
class SymbolResolver {
public:
  virtual ~SymbolResolver() = default;

  virtual const Symbol* resolveSymbol(const SyntaxNode& node) const = 0;
  virtual const TypeDescriptor* typeOf(const SyntaxNode& expression) const = 0;
  virtual const TypeDescriptor* lookupType(const std::string& canonicalName) const = 0;
  virtual std::optional<OperationKind> operationOf(const SyntaxNode& node) const = 0;

  // Identity equality; two misses are not equal.
  static bool equals(const TypeDescriptor* a, const TypeDescriptor* b) { return a && a == b; }
};

} // namespace lfx
