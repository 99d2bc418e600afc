#include <gtest/gtest.h>

#include <string>

#include "tova/test_support/parse_helpers.hpp"

using tova::test_support::compile;
using tova::test_support::count_occurrences;

namespace
{

bool contains(const std::string & haystack, const std::string & needle)
{
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

// ============================================================================
// Expressions
// ============================================================================

TEST(CodegenBaseEmitter, StringTimesIntRepeats)
{
  const auto unit = compile("laugh = \"ha\" * 3\n");
  EXPECT_TRUE(contains(unit.output.shared, "const laugh = \"ha\".repeat(3);"))
    << unit.output.shared;
}

TEST(CodegenBaseEmitter, NumericMultiplicationStaysArithmetic)
{
  const auto unit = compile("area = 4 * 3\n");
  EXPECT_TRUE(contains(unit.output.shared, "const area = (4 * 3);")) << unit.output.shared;
}

TEST(CodegenBaseEmitter, EqualityIsStrict)
{
  const auto unit = compile("a = 1\nsame = a == 1\ndiff = a != 2\n");
  EXPECT_TRUE(contains(unit.output.shared, "(a === 1)"));
  EXPECT_TRUE(contains(unit.output.shared, "(a !== 2)"));
}

TEST(CodegenBaseEmitter, TemplateBecomesTemplateLiteral)
{
  const auto unit = compile("name = \"Ada\"\ngreeting = \"Hi {name}!\"\n");
  EXPECT_TRUE(contains(unit.output.shared, "const greeting = `Hi ${name}!`;"))
    << unit.output.shared;
}

TEST(CodegenBaseEmitter, PipeInsertsLeftAsFirstArgument)
{
  const auto unit = compile(
    "fn add(a, b) { a + b }\n"
    "total = 1 |> add(2)\n");
  EXPECT_TRUE(contains(unit.output.shared, "const total = add(1, 2);")) << unit.output.shared;
}

// ============================================================================
// Statements and declarations
// ============================================================================

TEST(CodegenBaseEmitter, BindingsAndReassignment)
{
  const auto unit = compile("var count = 0\ncount = 5\nlimit = 10\n");
  EXPECT_TRUE(contains(unit.output.shared, "let count = 0;"));
  EXPECT_TRUE(contains(unit.output.shared, "count = 5;"));
  EXPECT_TRUE(contains(unit.output.shared, "const limit = 10;"));
  EXPECT_EQ(count_occurrences(unit.output.shared, "count = 5;"), 1U);
}

TEST(CodegenBaseEmitter, LastExpressionIsReturned)
{
  const auto unit = compile("fn add(a, b) {\n  a + b\n}\n");
  EXPECT_TRUE(contains(unit.output.shared, "function add(a, b) {"));
  EXPECT_TRUE(contains(unit.output.shared, "return (a + b);")) << unit.output.shared;
}

TEST(CodegenBaseEmitter, AdtVariantsBecomeTaggedObjects)
{
  const auto unit = compile(
    "type Shape {\n"
    "  Circle(radius: Float)\n"
    "  Empty\n"
    "}\n");
  EXPECT_TRUE(contains(
    unit.output.shared,
    "function Circle(radius) { return Object.freeze({ __tag: \"Circle\", radius }); }"))
    << unit.output.shared;
  EXPECT_TRUE(contains(unit.output.shared, "const Empty = Object.freeze({ __tag: \"Empty\" });"));
}

// ============================================================================
// Error propagation
// ============================================================================

TEST(CodegenBaseEmitter, PropagateWrapsFunctionBody)
{
  const auto unit = compile(
    "fn parse_num(s) { Ok(1) }\n"
    "fn load(s) {\n"
    "  v = parse_num(s)?\n"
    "  v + 1\n"
    "}\n");
  const std::string & js = unit.output.shared;
  EXPECT_TRUE(contains(js, "const v = __propagate(parse_num(s));")) << js;
  EXPECT_TRUE(contains(js, "} catch (__e) {"));
  EXPECT_TRUE(contains(js, "if (__e instanceof __TovaPropagate) return __e.value;"));
  EXPECT_TRUE(contains(js, "class __TovaPropagate"));
  EXPECT_TRUE(contains(js, "function __propagate(val)"));
}

TEST(CodegenBaseEmitter, NoPropagateNoWrapper)
{
  const auto unit = compile("fn load(s) {\n  s + 1\n}\n");
  EXPECT_FALSE(contains(unit.output.shared, "__TovaPropagate"));
  EXPECT_FALSE(contains(unit.output.shared, "try {"));
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(CodegenBaseEmitter, ConcurrentBlockGathersOnce)
{
  const auto unit = compile(
    "fn fetch_a() { 1 }\n"
    "fn fetch_b() { 2 }\n"
    "async fn main() {\n"
    "  concurrent {\n"
    "    a = spawn fetch_a()\n"
    "    b = spawn fetch_b()\n"
    "  }\n"
    "}\n");
  const std::string & js = unit.output.shared;
  EXPECT_EQ(count_occurrences(js, "Promise.all("), 1U) << js;
  EXPECT_TRUE(contains(
    js, "Promise.all([__spawn(async () => fetch_a()), __spawn(async () => fetch_b())]);"));
  EXPECT_TRUE(contains(js, "const a = __results_"));
  EXPECT_TRUE(contains(js, "const b = __results_"));
  EXPECT_TRUE(contains(js, "async function main()"));
  EXPECT_TRUE(contains(js, "async function __spawn(task)"));
}

TEST(CodegenBaseEmitter, ConcurrentModesUseRuntimeHelpers)
{
  const auto unit = compile(
    "fn work() { 1 }\n"
    "async fn main() {\n"
    "  concurrent cancel_on_error timeout(500) {\n"
    "    a = spawn work()\n"
    "  }\n"
    "}\n");
  const std::string & js = unit.output.shared;
  EXPECT_TRUE(contains(js, "__with_timeout(__gather_cancel_on_error(")) << js;
  EXPECT_TRUE(contains(js, ", 500, 1)"));
  EXPECT_TRUE(contains(js, "function __gather_cancel_on_error(tasks)"));
  EXPECT_TRUE(contains(js, "function __with_timeout(gathered, ms, count)"));
  EXPECT_FALSE(contains(js, "Promise.all("));
}

// ============================================================================
// Tree shaking and output shape
// ============================================================================

TEST(CodegenBaseEmitter, OnlyReferencedBuiltinsAreEmitted)
{
  const auto unit = compile("print(\"hello\")\n");
  const std::string & js = unit.output.shared;
  EXPECT_TRUE(contains(js, "function print(...args)"));
  EXPECT_FALSE(contains(js, "class _Ok"));
  EXPECT_FALSE(contains(js, "__contains"));
}

TEST(CodegenBaseEmitter, UserDefinitionShadowsBuiltin)
{
  const auto unit = compile("fn print(x) { x }\nprint(1)\n");
  EXPECT_FALSE(contains(unit.output.shared, "console.log"));
}

TEST(CodegenBaseEmitter, ProgramWithoutBlocksIsAModule)
{
  const auto unit = compile("x = 1\n");
  EXPECT_TRUE(unit.output.isModule);
  EXPECT_TRUE(unit.output.client.empty());
  EXPECT_TRUE(unit.output.server.empty());
  EXPECT_EQ(unit.output.shared, "const x = 1;\n");
}

TEST(CodegenBaseEmitter, SourceMappingsFollowTopLevelStatements)
{
  tova::codegen::CodegenOptions options;
  options.sourceMaps = true;
  const auto unit = compile("x = 1\ny = 2\n", options);

  ASSERT_TRUE(unit.output.sourceMappings.has_value());
  const auto & m = *unit.output.sourceMappings;
  ASSERT_EQ(m.size(), 2U);
  EXPECT_EQ(m[0].sourceLine, 1U);
  EXPECT_EQ(m[0].outputLine, 1U);
  EXPECT_EQ(m[1].sourceLine, 2U);
  EXPECT_EQ(m[1].sourceColumn, 1U);
  EXPECT_EQ(m[1].outputLine, 2U);

  const auto json = unit.output.mappings_json();
  ASSERT_TRUE(json.is_array());
  EXPECT_EQ(json[1]["output_line"], 2);
}

TEST(CodegenBaseEmitter, SourceMappingsOffByDefault)
{
  const auto unit = compile("x = 1\n");
  EXPECT_FALSE(unit.output.sourceMappings.has_value());
  EXPECT_TRUE(unit.output.mappings_json().is_null());
}
