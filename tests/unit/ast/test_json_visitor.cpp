#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "tova/ast/json_visitor.hpp"
#include "tova/test_support/parse_helpers.hpp"

using tova::test_support::parse;

TEST(AstJsonVisitor, DumpsProgramWithTypedNodes)
{
  auto unit = parse("total = a + 1");
  const nlohmann::json j = tova::to_json(unit->program);

  EXPECT_EQ(j["type"], "Program");
  ASSERT_EQ(j["body"].size(), 1U);

  const auto & assign = j["body"][0];
  EXPECT_EQ(assign["type"], "Assignment");
  EXPECT_EQ(assign["targets"][0]["name"], "total");
  EXPECT_TRUE(assign["annotation"].is_null());

  const auto & value = assign["values"][0];
  EXPECT_EQ(value["type"], "BinaryExpr");
  EXPECT_EQ(value["op"], "+");
  EXPECT_EQ(value["lhs"]["type"], "Identifier");
  EXPECT_EQ(value["rhs"]["type"], "NumberLiteral");
  EXPECT_EQ(value["rhs"]["isFloat"], false);
}

TEST(AstJsonVisitor, RangesAreByteOffsets)
{
  auto unit = parse("x = 1\nname = \"tova\"");
  const nlohmann::json j = tova::to_json(unit->program);

  ASSERT_EQ(j["body"].size(), 2U);
  const auto & second = j["body"][1];
  EXPECT_EQ(second["range"]["start"], 6);
  EXPECT_EQ(second["values"][0]["type"], "StringLiteral");
  EXPECT_EQ(second["values"][0]["value"], "tova");
}

TEST(AstJsonVisitor, VarDeclListsNames)
{
  auto unit = parse("var a, b = 1, 2");
  const nlohmann::json j = tova::to_json(unit->program);

  const auto & decl = j["body"][0];
  EXPECT_EQ(decl["type"], "VarDecl");
  EXPECT_EQ(decl["names"], nlohmann::json::array({"a", "b"}));
  EXPECT_EQ(decl["values"].size(), 2U);
}
