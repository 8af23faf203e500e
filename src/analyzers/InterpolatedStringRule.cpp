#include "analyzers/Analyzer.hpp"

namespace lfx {

namespace {

const char* const kDollarId = "FL0007";
const char* const kUnnecessaryId = "FL0014";
constexpr char kStrayMarker = '$';

class InterpolatedStringRule final : public Rule {
public:
  std::vector<RuleDescriptor> descriptors() const override {
    return {dollarDescriptor(), unnecessaryDescriptor()};
  }

  std::vector<Trigger> triggers() const override {
    return {Trigger::operation(OperationKind::InterpolatedString)};
  }

  void evaluate(const RuleContext& ctx) const override {
    const auto& str = ctx.node();

    if (!str.childOfKind(NodeKind::Interpolation))
      ctx.report(unnecessaryDescriptor(), str);

    // $"cost: ${price}" -- the "$" belongs to the text, "{price}" is a hole.
    bool afterMarker = false;
    for (const auto& part : str.children) {
      if (!part) continue;
      if (part->is(NodeKind::InterpolatedText) && !part->text.empty() &&
          part->text.back() == kStrayMarker) {
        afterMarker = true;
        continue;
      }
      if (afterMarker) ctx.report(dollarDescriptor(), *part);
      afterMarker = false;
    }
  }

private:
  static const RuleDescriptor& dollarDescriptor() {
    static const RuleDescriptor d{
      kDollarId,
      "Unintentional ${} in interpolated strings",
      "Avoid using ${} in interpolated strings.",
      "Usage",
      Severity::Warning,
      true,
      helpLinkFor(kDollarId),
    };
    return d;
  }

  static const RuleDescriptor& unnecessaryDescriptor() {
    static const RuleDescriptor d{
      kUnnecessaryId,
      "Unnecessary interpolated string",
      "Avoid using an interpolated string where an equivalent literal string exists.",
      "Usage",
      Severity::Warning,
      true,
      helpLinkFor(kUnnecessaryId),
    };
    return d;
  }
};

} // namespace

std::unique_ptr<Rule> makeInterpolatedStringRule() {
  return std::make_unique<InterpolatedStringRule>();
}

} // namespace lfx
