#include "analyzers/Finding.hpp"

namespace lfx {

const char* severityName(Severity s) {
  switch (s) {
  case Severity::Info:    return "info";
  case Severity::Warning: return "warning";
  case Severity::Error:   return "error";
  }
  return "?";
}

std::string helpLinkFor(const std::string& ruleId) {
  return "https://github.com/Faithlife/FaithlifeAnalyzers/wiki/" + ruleId;
}

} // namespace lfx
