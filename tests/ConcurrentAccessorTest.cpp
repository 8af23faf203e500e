#include "TestPrograms.hpp"

#include <gtest/gtest.h>

using namespace lfx;
using namespace lfx::fixtures;

namespace {

const char* const kPrelude = R"lfx(
(declare-type "System.Collections.Concurrent.ConcurrentDictionary`2")
(declare-type "System.Collections.Concurrent.ConcurrentDictionary<string, int>"
              :definition "System.Collections.Concurrent.ConcurrentDictionary`2" :args ("string" "int"))
(declare-type "System.Collections.Generic.Dictionary`2")
(declare-type "System.Collections.Generic.Dictionary<string, int>"
              :definition "System.Collections.Generic.Dictionary`2" :args ("string" "int"))
(declare-type "Libronix.Utility.DictionaryUtility")
(declare-member "Libronix.Utility.DictionaryUtility" "GetOrAddValue" :kind method :type "int")
(declare-type "Demo.Helpers")
(declare-member "Demo.Helpers" "GetOrAddValue" :kind method :type "int")
)lfx";

const char* const kConcurrent = "System.Collections.Concurrent.ConcurrentDictionary<string, int>";
const char* const kPlain = "System.Collections.Generic.Dictionary<string, int>";
const char* const kUtility = "Libronix.Utility.DictionaryUtility::GetOrAddValue";

// dict.GetOrAddValue("key")
std::string memberCall(const std::string& type, const std::string& method) {
  return "(expr-stmt (call (member :symbol \"" + method + "\" (id dict :type \"" + type +
         "\") (id GetOrAddValue)) (args (str key))))";
}

// dict?.GetOrAddValue("key")
std::string conditionalCall(const std::string& type, const std::string& method) {
  return "(expr-stmt (cond-access (id dict :type \"" + type + "\") (call (binding :symbol \"" +
         method + "\" (id GetOrAddValue)) (args (str key)))))";
}

AnalysisResult run(const std::string& statements) {
  auto file = readTree(methodProgram(kPrelude, statements, "(using Libronix.Utility)"));
  auto registry = RuleRegistry::withBuiltinRules();
  return analyzeWith(registry, file);
}

} // namespace

TEST(ConcurrentAccessor, FlagsMemberAccessCall) {
  auto file = readTree(methodProgram(kPrelude, memberCall(kConcurrent, kUtility), "(using Libronix.Utility)"));
  auto registry = RuleRegistry::withBuiltinRules();
  auto result = analyzeWith(registry, file);

  ASSERT_EQ(result.findings.size(), 1u);
  const auto& f = result.findings[0];
  EXPECT_EQ(f.ruleId, "FL0011");
  EXPECT_EQ(f.severity, Severity::Warning);
  EXPECT_EQ(f.message, "GetOrAddValue() is not threadsafe and should not be used with "
                       "ConcurrentDictionary; use GetOrAdd() instead.");
  EXPECT_EQ(file.tree->text().substr(f.span.start, f.span.length), "GetOrAddValue");
  EXPECT_EQ(f.span.line, 9u);
  EXPECT_EQ(f.span.column, 9u);
}

TEST(ConcurrentAccessor, FlagsConditionalAccessCall) {
  auto result = run(conditionalCall(kConcurrent, kUtility));
  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_EQ(result.findings[0].ruleId, "FL0011");
  EXPECT_EQ(result.findings[0].span.column, 10u);
}

TEST(ConcurrentAccessor, IgnoresOrdinaryDictionary) {
  EXPECT_TRUE(run(memberCall(kPlain, kUtility)).findings.empty());
  EXPECT_TRUE(run(conditionalCall(kPlain, kUtility)).findings.empty());
}

TEST(ConcurrentAccessor, IgnoresSameNameOnOtherType) {
  EXPECT_TRUE(run(memberCall(kConcurrent, "Demo.Helpers::GetOrAddValue")).findings.empty());
}

TEST(ConcurrentAccessor, IgnoresUnresolvedCall) {
  EXPECT_TRUE(run("(expr-stmt (call (member (id dict :type \"" + std::string(kConcurrent) +
                  "\") (id GetOrAddValue)) (args (str key))))").findings.empty());
}
