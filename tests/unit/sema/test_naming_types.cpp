#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "tova/sema/naming.hpp"
#include "tova/sema/types/type.hpp"
#include "tova/sema/types/type_utils.hpp"

using namespace tova;

TEST(SemaNaming, CaseConventions)
{
  EXPECT_TRUE(naming::is_snake_case("user_name"));
  EXPECT_TRUE(naming::is_snake_case("x"));
  EXPECT_TRUE(naming::is_snake_case("MAX_RETRIES"));
  EXPECT_FALSE(naming::is_snake_case("userName"));
  EXPECT_FALSE(naming::is_snake_case("user__name"));

  EXPECT_TRUE(naming::is_pascal_case("UserRecord"));
  EXPECT_FALSE(naming::is_pascal_case("user_record"));
  EXPECT_FALSE(naming::is_pascal_case("User_Record"));

  EXPECT_TRUE(naming::is_upper_snake_case("MAX_SIZE"));
  EXPECT_FALSE(naming::is_upper_snake_case("Max_Size"));
}

TEST(SemaNaming, Conversions)
{
  EXPECT_EQ(naming::to_snake_case("getUserName"), "get_user_name");
  EXPECT_EQ(naming::to_pascal_case("user_record"), "UserRecord");
}

TEST(SemaNaming, ClosestMatch)
{
  EXPECT_EQ(naming::edit_distance("kitten", "sitting"), 3U);

  const std::vector<std::string_view> candidates = {"length", "print", "filter"};
  const auto hit = naming::closest_match("lenght", candidates);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(*hit, "length");

  EXPECT_FALSE(naming::closest_match("completely_different", candidates).has_value());
  EXPECT_FALSE(naming::closest_match("print", candidates).has_value());
}

TEST(SemaTypes, GradualAssignability)
{
  TypeContext types;
  const Type * i = types.int_type();
  const Type * f = types.float_type();
  const Type * s = types.string_type();

  EXPECT_TRUE(is_assignable(f, i));
  EXPECT_FALSE(is_assignable(i, f));
  EXPECT_FALSE(is_assignable(i, s));
  EXPECT_TRUE(is_assignable(i, types.any_type()));
  EXPECT_TRUE(is_assignable(s, types.unknown_type()));
  EXPECT_TRUE(is_assignable(i, nullptr));

  EXPECT_TRUE(is_assignable(types.get_array_type(f), types.get_array_type(i)));
  EXPECT_FALSE(is_assignable(types.get_array_type(i), types.get_array_type(s)));
}

TEST(SemaTypes, CompositeTypesAreInterned)
{
  TypeContext types;
  const Type * a = types.get_array_type(types.int_type());
  const Type * b = types.get_array_type(types.int_type());
  EXPECT_EQ(a, b);

  const Type * result = types.get_generic_type("Result", {types.int_type(), types.string_type()});
  EXPECT_EQ(to_string(result), "Result<Int, String>");
  EXPECT_EQ(to_string(a), "[Int]");
}

TEST(SemaTypes, ConversionHints)
{
  TypeContext types;
  const auto hint = conversion_hint(types.int_type(), types.string_type());
  ASSERT_TRUE(hint.has_value());
  EXPECT_EQ(*hint, "try toInt(value) to parse");
}
