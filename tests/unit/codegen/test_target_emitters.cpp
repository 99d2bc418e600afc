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

std::string last_line(const std::string & text)
{
  std::string trimmed = text;
  while (!trimmed.empty() && trimmed.back() == '\n') trimmed.pop_back();
  const auto pos = trimmed.rfind('\n');
  return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

}  // namespace

// ============================================================================
// Client
// ============================================================================

TEST(CodegenClientEmitter, StateBecomesSignalAndAppIsMounted)
{
  const auto unit = compile(
    "client {\n"
    "  state count = 0\n"
    "  component App {\n"
    "    <div>{count}</div>\n"
    "  }\n"
    "}\n");
  const std::string & js = unit.output.client;
  EXPECT_FALSE(unit.output.isModule);
  EXPECT_TRUE(contains(js, "from \"./runtime/reactivity.js\";")) << js;
  EXPECT_TRUE(contains(js, "const [count, setCount] = createSignal(0);"));
  EXPECT_TRUE(contains(js, "function App("));
  EXPECT_TRUE(contains(js, "mount(App, document.getElementById(\"app\") || document.body);"));
  EXPECT_FALSE(contains(js, "const server = {"));
}

TEST(CodegenClientEmitter, ServerFunctionsGetRpcStubs)
{
  const auto unit = compile(
    "server {\n"
    "  fn get_todos() { [] }\n"
    "}\n"
    "client {\n"
    "  state todos = []\n"
    "}\n");
  const std::string & js = unit.output.client;
  EXPECT_TRUE(contains(js, "async function __rpc(name, args) {")) << js;
  EXPECT_TRUE(contains(js, "const server = {"));
  EXPECT_TRUE(contains(js, "get_todos: (...args) => __rpc(\"get_todos\", args),"));
  EXPECT_FALSE(contains(js, "mount(App"));
}

// ============================================================================
// Server
// ============================================================================

TEST(CodegenServerEmitter, FunctionsRoutesAndRpcEndpoints)
{
  const auto unit = compile(
    "server {\n"
    "  fn list_users(req) { [] }\n"
    "  route GET \"/api/users\" => list_users\n"
    "}\n");
  const std::string & js = unit.output.server;
  EXPECT_TRUE(contains(js, "import { Hono } from \"hono\";")) << js;
  EXPECT_TRUE(contains(js, "const app = new Hono();"));
  EXPECT_TRUE(contains(js, "function list_users(req) {"));
  EXPECT_TRUE(contains(js, "app.post(\"/rpc/list_users\", async (c) => {"));
  EXPECT_TRUE(contains(js, "app.get(\"/api/users\", async (c) => {"));
  EXPECT_TRUE(contains(js, "const result = await list_users(c);"));
  EXPECT_EQ(last_line(js), "export default { port, fetch: app.fetch };");
  EXPECT_TRUE(unit.output.client.empty());
}

TEST(CodegenServerEmitter, SharedCodeIsInlined)
{
  const auto unit = compile(
    "shared {\n"
    "  fn clamp(x, lo, hi) { if x < lo { lo } else { x } }\n"
    "}\n"
    "server {\n"
    "  fn limit(n) { clamp(n, 0, 10) }\n"
    "}\n");
  EXPECT_TRUE(contains(unit.output.shared, "function clamp(x, lo, hi)"));
  EXPECT_TRUE(contains(unit.output.server, "function clamp(x, lo, hi)"));
  EXPECT_EQ(count_occurrences(unit.output.server, "function clamp("), 1U);
}

// ============================================================================
// Edge
// ============================================================================

TEST(CodegenEdgeEmitter, DenoTarget)
{
  const auto unit = compile(
    "edge {\n"
    "  target: \"deno\"\n"
    "  fn hello(req) { \"hi\" }\n"
    "  route GET \"/hi\" => hello\n"
    "}\n");
  const std::string & js = unit.output.edge;
  EXPECT_TRUE(contains(js, "Deno.serve(")) << js;
  EXPECT_TRUE(contains(js, "function hello(req)"));
  EXPECT_FALSE(contains(js, "async fetch(request, env, ctx)"));
}

TEST(CodegenEdgeEmitter, DefaultsToCloudflare)
{
  const auto unit = compile(
    "edge {\n"
    "  fn hello(req) { \"hi\" }\n"
    "  route GET \"/hi\" => hello\n"
    "}\n");
  EXPECT_TRUE(contains(unit.output.edge, "async fetch(request, env, ctx)")) << unit.output.edge;
}

TEST(CodegenEdgeEmitter, NamedEdgeBlocksGetTheirOwnOutput)
{
  const auto unit = compile(
    "edge \"api\" {\n"
    "  target: \"bun\"\n"
    "  fn ping(req) { \"pong\" }\n"
    "  route GET \"/ping\" => ping\n"
    "}\n");
  EXPECT_TRUE(unit.output.edge.empty());
  ASSERT_EQ(unit.output.edges.count("api"), 1U);
  EXPECT_TRUE(contains(unit.output.edges.at("api"), "Bun.serve("));
}

// ============================================================================
// Deploy
// ============================================================================

TEST(CodegenDeployEmitter, DefaultsAreFilledAndOverridden)
{
  const auto unit = compile(
    "deploy \"prod\" {\n"
    "  server: \"root@example.com\"\n"
    "  instances: 2\n"
    "}\n");
  const auto & deploy = unit.output.deploy;
  ASSERT_TRUE(deploy.contains("prod"));
  const auto & prod = deploy["prod"];
  EXPECT_EQ(prod["name"], "prod");
  EXPECT_EQ(prod["server"], "root@example.com");
  EXPECT_EQ(prod["instances"], 2);
  EXPECT_EQ(prod["memory"], "512mb");
  EXPECT_EQ(prod["branch"], "main");
  EXPECT_EQ(prod["health"], "/healthz");
  EXPECT_EQ(prod["health_interval"], 30);
  EXPECT_EQ(prod["restart_on_failure"], true);
  EXPECT_EQ(prod["keep_releases"], 5);
  EXPECT_TRUE(prod["env"].is_object());
  EXPECT_TRUE(prod["databases"].empty());
}

// ============================================================================
// CLI
// ============================================================================

TEST(CodegenCliEmitter, BoolParametersBecomeToggleFlags)
{
  const auto unit = compile(
    "cli {\n"
    "  name: \"greet\"\n"
    "  fn hello(name: String, loud: Bool = false) { print(name) }\n"
    "}\n");
  const std::string & js = unit.output.cli;
  EXPECT_TRUE(contains(js, "function __cli_dispatch_hello(argv) {")) << js;
  EXPECT_TRUE(contains(js, "let __flag_loud = false;"));
  EXPECT_TRUE(contains(js, "__flag_loud = true"));
  EXPECT_TRUE(contains(js, "\"--no-loud\""));
  EXPECT_EQ(last_line(js), "__cli_main(process.argv.slice(2));");
}
