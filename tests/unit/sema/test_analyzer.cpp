#include <gtest/gtest.h>

#include <string>

#include "tova/basic/error_codes.hpp"
#include "tova/basic/errors.hpp"
#include "tova/test_support/parse_helpers.hpp"

using namespace tova;
using tova::test_support::analyze;

namespace ec = tova::error_codes;

// ============================================================================
// Type checks
// ============================================================================

TEST(SemaAnalyzer, ArgumentTypeMismatchSuggestsConversion)
{
  const auto unit = analyze(
    "fn twice(n: Int) -> Int { n * 2 }\n"
    "twice(\"21\")\n");

  ASSERT_EQ(unit.result.errors.size(), 1U);
  const Diagnostic & d = unit.result.errors[0];
  EXPECT_EQ(d.code, ec::k_invalid_argument_type);
  EXPECT_EQ(d.message, "Type mismatch: 'n' expects Int, but got String");
  ASSERT_TRUE(d.hint.has_value());
  EXPECT_EQ(*d.hint, "try toInt(value) to parse");
  EXPECT_EQ(d.line, 2U);
}

TEST(SemaAnalyzer, IntArgumentWidensToFloat)
{
  const auto unit = analyze(
    "fn half(x: Float) -> Float { x / 2.0 }\n"
    "half(3)\n");
  EXPECT_TRUE(unit.result.errors.empty());
}

TEST(SemaAnalyzer, ReturnTypeMismatch)
{
  const auto unit = analyze(
    "fn name() -> String {\n"
    "  return 42\n"
    "}\n");
  EXPECT_TRUE(unit.has_code(ec::k_return_type_mismatch));
  EXPECT_TRUE(unit.has_error("function expects return type String, but got Int"));
}

TEST(SemaAnalyzer, UnannotatedCodeIsNotChecked)
{
  const auto unit = analyze(
    "fn combine(a, b) { a + b }\n"
    "combine(1, \"two\")\n"
    "combine([1], nil)\n");
  EXPECT_TRUE(unit.result.errors.empty());
}

TEST(SemaAnalyzer, WrongArgumentCount)
{
  const auto unit = analyze(
    "fn add(a: Int, b: Int) -> Int { a + b }\n"
    "add(1, 2, 3)\n");
  EXPECT_TRUE(unit.has_code(ec::k_wrong_argument_count));
  EXPECT_TRUE(unit.has_error("'add' expects 2 arguments, but got 3"));
}

TEST(SemaAnalyzer, DefaultParametersLowerTheMinimum)
{
  const auto unit = analyze(
    "fn greet(name: String, greeting = \"Hello\") { \"{greeting}, {name}\" }\n"
    "greet(\"Ada\")\n"
    "greet()\n");
  ASSERT_EQ(unit.result.errors.size(), 1U);
  EXPECT_EQ(unit.result.errors[0].message, "'greet' expects at least 1 argument, but got 0");
}

TEST(SemaAnalyzer, OperandMismatchIsWarningUnlessStrict)
{
  const std::string src = "x = true - 1\n";

  const auto lenient = analyze(src);
  EXPECT_TRUE(lenient.result.errors.empty());
  EXPECT_TRUE(lenient.has_warning("'-' expects numeric type, but got Bool"));

  const auto strict = analyze(src, AnalyzerOptions{true, true});
  EXPECT_TRUE(strict.has_error("'-' expects numeric type, but got Bool"));
}

// ============================================================================
// Scopes and bindings
// ============================================================================

TEST(SemaAnalyzer, DuplicateDeclarationInSameScope)
{
  const auto unit = analyze("var x = 1\nvar x = 2\n");
  EXPECT_TRUE(unit.has_code(ec::k_duplicate));
  EXPECT_TRUE(unit.has_error("'x' is already defined in this scope"));
}

TEST(SemaAnalyzer, ImmutableBindingCannotBeReassigned)
{
  const auto unit = analyze("x = 1\nx = 2\n");
  EXPECT_TRUE(unit.has_code(ec::k_immutable_reassign));
}

TEST(SemaAnalyzer, VarBindingCanBeReassigned)
{
  const auto unit = analyze("var x = 1\nx = 2\nx += 3\n");
  EXPECT_TRUE(unit.result.errors.empty());
}

TEST(SemaAnalyzer, CompoundAssignOnImmutable)
{
  const auto unit = analyze("x = 1\nx += 1\n");
  EXPECT_TRUE(unit.has_error("Cannot use '+=' on immutable variable 'x'"));
}

TEST(SemaAnalyzer, UndefinedNameIsWarningWithSuggestion)
{
  const auto unit = analyze(
    "fn main() {\n"
    "  length = 3\n"
    "  print(lenght)\n"
    "}\n");
  EXPECT_TRUE(unit.result.errors.empty());
  ASSERT_TRUE(unit.has_warning("'lenght' is not defined"));
  bool hinted = false;
  for (const auto & w : unit.result.warnings) {
    if (w.code == ec::k_undefined && w.hint && w.hint->find("length") != std::string::npos) {
      hinted = true;
    }
  }
  EXPECT_TRUE(hinted);
}

TEST(SemaAnalyzer, UnusedLocalIsWarned)
{
  const auto unit = analyze(
    "fn compute() {\n"
    "  temp = 1\n"
    "  _ignored = 2\n"
    "  3\n"
    "}\n");
  EXPECT_TRUE(unit.has_warning("'temp' is declared but never used"));
  EXPECT_FALSE(unit.has_warning("'_ignored'"));
}

TEST(SemaAnalyzer, ShadowingOuterBinding)
{
  const auto unit = analyze(
    "fn outer() {\n"
    "  value = 1\n"
    "  inner = fn() {\n"
    "    value = 2\n"
    "    value\n"
    "  }\n"
    "  inner() + value\n"
    "}\n");
  EXPECT_TRUE(unit.has_code(ec::k_shadowed_binding));
}

TEST(SemaAnalyzer, NamingConventions)
{
  const auto unit = analyze(
    "fn getUser() { nil }\n"
    "type user_record { name: String }\n");
  EXPECT_TRUE(unit.has_code(ec::k_naming_convention));
  EXPECT_TRUE(unit.has_warning("'getUser'"));
  EXPECT_TRUE(unit.has_warning("'user_record'"));
}

// ============================================================================
// Control flow and context
// ============================================================================

TEST(SemaAnalyzer, NonExhaustiveMatchNamesOnlyMissingVariants)
{
  const auto unit = analyze(
    "type Color { Red\n Blue\n Green }\n"
    "fn describe(c: Color) -> String {\n"
    "  match c {\n"
    "    Red => \"red\"\n"
    "    Blue => \"blue\"\n"
    "  }\n"
    "}\n");
  EXPECT_TRUE(unit.has_code(ec::k_non_exhaustive_match));
  EXPECT_TRUE(unit.has_warning("Non-exhaustive match: missing 'Green' variant from type 'Color'"));
  EXPECT_FALSE(unit.has_warning("missing 'Red'"));
  EXPECT_FALSE(unit.has_warning("missing 'Blue'"));
}

TEST(SemaAnalyzer, WildcardMakesMatchExhaustive)
{
  const auto unit = analyze(
    "type Color { Red\n Blue\n Green }\n"
    "fn describe(c: Color) -> String {\n"
    "  match c {\n"
    "    Red => \"red\"\n"
    "    _ => \"other\"\n"
    "  }\n"
    "}\n");
  EXPECT_FALSE(unit.has_code(ec::k_non_exhaustive_match));
}

TEST(SemaAnalyzer, AwaitOutsideAsyncFunction)
{
  const auto unit = analyze(
    "fn load() {\n"
    "  await fetch_data()\n"
    "}\n");
  EXPECT_TRUE(unit.has_code(ec::k_await_outside_async));
  EXPECT_TRUE(unit.has_error("'await' can only be used inside an async function"));
}

TEST(SemaAnalyzer, AwaitInsideAsyncFunction)
{
  const auto unit = analyze(
    "async fn load() {\n"
    "  await fetch_data()\n"
    "}\n");
  EXPECT_FALSE(unit.has_code(ec::k_await_outside_async));
}

TEST(SemaAnalyzer, ReturnAndBreakOutsideTheirContext)
{
  const auto unit = analyze("return 1\nbreak\n");
  EXPECT_TRUE(unit.has_error("'return' can only be used inside a function"));
  EXPECT_TRUE(unit.has_error("'break' can only be used inside a loop"));
}

TEST(SemaAnalyzer, ClientStateIsReassignable)
{
  const auto unit = analyze(
    "client {\n"
    "  state count = 0\n"
    "  fn increment() { count += 1 }\n"
    "}\n");
  EXPECT_TRUE(unit.result.errors.empty());
}

// ============================================================================
// Error reporting mode
// ============================================================================

TEST(SemaAnalyzer, NonTolerantAnalysisThrowsAggregatedError)
{
  try {
    (void)analyze("var x = 1\nvar x = 2\n", AnalyzerOptions{});
    FAIL() << "expected AnalysisError";
  } catch (const AnalysisError & e) {
    ASSERT_FALSE(e.errors().empty());
    EXPECT_EQ(e.errors()[0].code, ec::k_duplicate);
  }
}

TEST(SemaAnalyzer, NonTolerantAnalysisReturnsWarnings)
{
  const auto unit = analyze("fn getUser() { nil }\n", AnalyzerOptions{});
  EXPECT_TRUE(unit.result.errors.empty());
  EXPECT_FALSE(unit.result.warnings.empty());
}
