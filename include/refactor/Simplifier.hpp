#pragma once
#include "syntax/SyntaxNode.hpp"

namespace lfx {

// Best-effort cleanup of a freshly built replacement subtree. Only the
// subtree passed in is touched.
//  - redundant parentheses around collection elements / spread operands
//  - `[..[a, b]]` flattened to `[a, b]`
class Simplifier {
public:
  static NodePtr reduce(const NodePtr& node);

private:
  static bool needsNoParens(const SyntaxNode& e);
  static NodePtr unwrap(const NodePtr& e);
};

} // namespace lfx
