#include "analyzers/RuleRegistry.hpp"

#include <stdexcept>

namespace lfx {

RuleRegistry& RuleRegistry::add(std::unique_ptr<Rule> rule) {
  if (!rule) throw std::invalid_argument("RuleRegistry::add: null rule");
  auto ds = rule->descriptors();
  for (const auto& d : ds)
    if (find(d.id))
      throw std::invalid_argument("RuleRegistry::add: duplicate rule id " + d.id);
  Descriptors.insert(Descriptors.end(), ds.begin(), ds.end());
  Rules.push_back(std::move(rule));
  return *this;
}

std::vector<RuleDescriptor> RuleRegistry::supportedRules() const {
  return Descriptors;
}

const RuleDescriptor* RuleRegistry::find(const std::string& id) const {
  for (const auto& d : Descriptors)
    if (d.id == id) return &d;
  return nullptr;
}

RuleRegistry RuleRegistry::withBuiltinRules() {
  RuleRegistry r;
  r.add(makeCollectionInitializationRule())
   .add(makeConcurrentAccessorRule())
   .add(makeWorkStateSentinelRule())
   .add(makeInterpolatedStringRule());
  return r;
}

} // namespace lfx
