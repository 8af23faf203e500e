#pragma once
#include "semantics/SymbolResolver.hpp"
#include "syntax/SyntaxNode.hpp"

#include <cstddef>

namespace lfx {

// Pattern classification shared by the FL0021 rule and its fix.
namespace collection_init {

extern const char* const kRuleId;
extern const char* const kListDefinition;
constexpr size_t kMaxInitializerElements = 10;

// How a `new List<T>(...)` creation maps onto a collection literal.
enum class Shape {
  None,      // leave alone
  Empty,     // new List<T>()            -> []
  Elements,  // new List<T> { a, b }     -> [a, b]
  Spread,    // new List<T>(source)      -> [..source]
};

// Constructed type's generic definition is List`1.
bool isListCreation(const SyntaxNode& creation, const SymbolResolver& resolver);

// At most ten elements, each a literal, a name or a simple member access.
bool isSimpleInitializer(const SyntaxNode& initializer);

// `x.Where(...)`, `x.Select(...)` and the other lazy sequence operators,
// judged by the outermost call's name.
bool isDeferredChain(const SyntaxNode& expression);

Shape classify(const SyntaxNode& creation);

} // namespace collection_init
} // namespace lfx
