#pragma once
#include "syntax/SyntaxTree.hpp"

#include <functional>
#include <string>
#include <vector>

namespace lfx {

enum class Severity { Info, Warning, Error };

const char* severityName(Severity s);
// Documentation page of a rule id.
std::string helpLinkFor(const std::string& ruleId);

struct RuleDescriptor {
  std::string id;             // eg. "FL0021"
  std::string title;
  std::string message;
  std::string category;       // "Style", "Usage"
  Severity    severity = Severity::Warning;
  bool        enabledByDefault = true;
  std::string helpLink;
};

// Builds the replacement for `target`, a node of `tree`. Must not assume any
// other proposal has been applied.
using RewriteFn = std::function<NodePtr(const SyntaxTree& tree, const SyntaxNode& target)>;

struct FixProposal {
  std::string ruleId;
  std::string title;          // eg. "Use collection expression"
  std::string equivalenceKey; // groups proposals of the same transform
  NodePtr     target;         // node of the analysed tree
  Span        span;
  RewriteFn   rewrite;
};

struct Finding {
  std::string ruleId;
  Severity    severity = Severity::Warning;  // copied from the descriptor
  std::string message;
  std::string file;
  Span        span;
  std::vector<FixProposal> fixes;            // filled by CodeFixService::attachFixes
};

// Internal failure of one rule at one node; never aborts a pass.
struct EngineFault {
  std::string ruleId;
  std::string file;
  Span        span;
  std::string what;
};

} // namespace lfx
