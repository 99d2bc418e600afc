// tova/codegen/server_emitter.cpp - Hono server output
#include "tova/codegen/server_emitter.hpp"

#include <fmt/format.h>

#include <cctype>

#include "tova/codegen/security_emitter.hpp"

namespace tova::codegen
{

std::vector<const FunctionDecl *> server_functions(const std::vector<const NamedBlock *> & blocks)
{
  std::vector<const FunctionDecl *> out;
  for (const auto * block : blocks) {
    for (const Stmt * s : block->body) {
      if (const auto * fn = dyn_cast<FunctionDecl>(s)) out.push_back(fn);
    }
  }
  return out;
}

std::string ServerEmitter::emit_region_member(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::RouteDecl:
      return emit_route(cast<RouteDecl>(stmt));
    case NodeKind::MiddlewareDecl: {
      const FunctionDecl * fn = cast<MiddlewareDecl>(stmt)->function;
      return emit_function(fn) + "\n" + ind() + fmt::format("app.use(\"*\", {});", fn->name);
    }
    default:
      return BaseEmitter::emit_region_member(stmt);
  }
}

std::string ServerEmitter::emit_rpc_endpoint(const FunctionDecl * fn)
{
  std::vector<std::string> named;
  for (const auto * p : fn->params) named.push_back("body." + std::string(p->name));

  std::vector<std::string> lines;
  lines.push_back(fmt::format("app.post(\"/rpc/{}\", async (c) => {{", fn->name));
  lines.emplace_back("  const body = await c.req.json().catch(() => ({}));");
  lines.push_back(fmt::format(
    "  const __args = Array.isArray(body.__args) ? body.__args : [{}];", join(named, ", ")));
  lines.push_back(fmt::format("  const result = await {}(...__args);", fn->name));
  lines.emplace_back("  return c.json({ result });");
  lines.emplace_back("});");
  return join(lines, "\n");
}

std::string ServerEmitter::emit_route(const RouteDecl * route)
{
  std::string method(route->method);
  for (char & c : method) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

  const std::string handler = emit_expr(route->handler);
  const bool bare = isa<Identifier>(route->handler) || isa<MemberExpr>(route->handler);
  const std::string call = bare ? handler : "(" + handler + ")";

  std::vector<std::string> lines;
  lines.push_back(
    fmt::format("{}app.{}({}, async (c) => {{", ind(), method, quote_js(route->path)));
  lines.push_back(fmt::format("{}  const result = await {}(c);", ind(), call));
  lines.push_back(ind() + "  if (result instanceof Response) return result;");
  lines.push_back(ind() + "  return c.json(result);");
  lines.push_back(ind() + "});");
  return join(lines, "\n");
}

std::string ServerEmitter::generate(
  const std::vector<const NamedBlock *> & blocks, const std::string & shared,
  const std::vector<const NamedBlock *> & security)
{
  SecurityEmitter policy(ctx_);
  policy.collect(security);

  std::vector<const FunctionDecl *> functions;
  std::vector<const Stmt *> middlewares;
  std::vector<const RouteDecl *> routes;
  std::vector<const Stmt *> other;
  for (const auto * block : blocks) {
    for (const Stmt * s : block->body) {
      if (const auto * fn = dyn_cast<FunctionDecl>(s)) {
        functions.push_back(fn);
      } else if (isa<MiddlewareDecl>(s)) {
        middlewares.push_back(s);
      } else if (const auto * r = dyn_cast<RouteDecl>(s)) {
        routes.push_back(r);
      } else {
        other.push_back(s);
      }
    }
  }

  // Routes may name functions declared after them.
  for (const auto * fn : functions) declare(fn->name);

  std::vector<std::string> sections;
  std::string imports = "import { Hono } from \"hono\";\nimport { cors } from \"hono/cors\";";
  if (policy.uses_jwt()) imports += "\nimport { verify } from \"hono/jwt\";";
  sections.push_back(std::move(imports));
  if (!shared.empty()) sections.push_back(shared);
  sections.emplace_back("const app = new Hono();\napp.use(\"/*\", cors());");

  if (!policy.empty()) sections.push_back(policy.emit_server_policy());

  std::vector<std::string> lines;
  for (const Stmt * m : middlewares) lines.push_back(emit_stmt(m));
  if (!lines.empty()) sections.push_back("// Middleware\n" + join(lines, "\n\n"));

  lines.clear();
  for (const Stmt * s : other) {
    std::string code = emit_stmt(s);
    if (!code.empty()) lines.push_back(std::move(code));
  }
  if (!lines.empty()) sections.push_back(join(lines, "\n"));

  lines.clear();
  for (const auto * fn : functions) lines.push_back(emit_function(fn));
  if (!lines.empty()) sections.push_back("// Server functions\n" + join(lines, "\n\n"));

  lines.clear();
  for (const auto * fn : functions) lines.push_back(emit_rpc_endpoint(fn));
  if (!lines.empty()) sections.push_back("// RPC endpoints\n" + join(lines, "\n\n"));

  lines.clear();
  for (const auto * r : routes) lines.push_back(emit_route(r));
  if (!lines.empty()) sections.push_back("// Routes\n" + join(lines, "\n\n"));

  sections.emplace_back(
    "const port = process.env.PORT || 3000;\nexport default { port, fetch: app.fetch };");
  return join(sections, "\n\n") + "\n";
}

}  // namespace tova::codegen
