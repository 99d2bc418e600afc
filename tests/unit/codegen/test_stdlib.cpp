#include <gtest/gtest.h>

#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "tova/codegen/edge_emitter.hpp"
#include "tova/codegen/security_emitter.hpp"
#include "tova/codegen/stdlib.hpp"

using namespace tova::codegen;

TEST(CodegenStdlib, ResolvePutsDependenciesFirst)
{
  const std::vector<std::string_view> some = stdlib::resolve({"Some"});
  EXPECT_EQ(some, (std::vector<std::string_view>{"None", "Some"}));

  const std::vector<std::string_view> json = stdlib::resolve({"json", "Some"});
  EXPECT_EQ(json, (std::vector<std::string_view>{"None", "Some", "Ok", "Err", "json"}));
}

TEST(CodegenStdlib, ResolveSkipsUnknownNames)
{
  EXPECT_TRUE(stdlib::resolve({"definitely_not_a_builtin"}).empty());
  EXPECT_TRUE(stdlib::emit({}).empty());
}

TEST(CodegenStdlib, RuntimeHelpersAreHiddenFromUserCode)
{
  EXPECT_TRUE(stdlib::is_user_visible("print"));
  EXPECT_TRUE(stdlib::is_user_visible("Ok"));
  EXPECT_FALSE(stdlib::is_user_visible("__propagate"));
  EXPECT_FALSE(stdlib::is_user_visible("not_in_stdlib"));
}

TEST(CodegenStdlib, PropagateHelperPullsInItsSignalClass)
{
  const std::string code = stdlib::emit({"__propagate"});
  const auto cls = code.find("class __TovaPropagate");
  const auto fn = code.find("function __propagate(val)");
  ASSERT_NE(cls, std::string::npos);
  ASSERT_NE(fn, std::string::npos);
  EXPECT_LT(cls, fn);
}

TEST(CodegenSecurity, GlobToRegex)
{
  EXPECT_EQ(glob_to_regex("/admin/**"), "\\/admin\\/.*");
  EXPECT_EQ(glob_to_regex("/api/*/items"), "\\/api\\/[^/]*\\/items");
  EXPECT_EQ(glob_to_regex("/a.b"), "\\/a\\.b");
}

TEST(CodegenEdge, RoutePatternCapturesParameters)
{
  const RoutePattern users = compile_route_pattern("/users/:id");
  EXPECT_EQ(users.regex, "^/users/([^/]+)$");
  EXPECT_EQ(users.paramNames, (std::vector<std::string>{"id"}));

  const RoutePattern files = compile_route_pattern("/files/*path");
  EXPECT_EQ(files.regex, "^/files/(.*)$");
  EXPECT_EQ(files.paramNames, (std::vector<std::string>{"path"}));

  const RoutePattern plain = compile_route_pattern("/v1.0/health");
  EXPECT_EQ(plain.regex, "^/v1\\.0/health$");
  EXPECT_TRUE(plain.paramNames.empty());
}
