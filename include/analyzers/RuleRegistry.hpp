#pragma once
#include "analyzers/Analyzer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lfx {

// Owns the rules a process knows about. Constructed once and handed by
// reference to every RuleEngine; engines pick their active subset from it.
class RuleRegistry {
public:
  RuleRegistry() = default;
  RuleRegistry(RuleRegistry&&) = default;
  RuleRegistry& operator=(RuleRegistry&&) = default;

  RuleRegistry& add(std::unique_ptr<Rule> rule);

  const std::vector<std::unique_ptr<Rule>>& rules() const { return Rules; }
  std::vector<RuleDescriptor> supportedRules() const;
  const RuleDescriptor* find(const std::string& id) const;

  // FL0021, FL0011, FL0008, FL0007/FL0014 in that order.
  static RuleRegistry withBuiltinRules();

private:
  std::vector<std::unique_ptr<Rule>> Rules;
  std::vector<RuleDescriptor> Descriptors;
};

} // namespace lfx
