// tova/codegen/edge_emitter.cpp - Serverless/edge output, one flavour per platform
#include "tova/codegen/edge_emitter.hpp"

#include <fmt/format.h>

#include <cctype>
#include <nlohmann/json.hpp>

namespace tova::codegen
{

EdgePlatform parse_edge_platform(std::string_view name) noexcept
{
  if (name == "deno") return EdgePlatform::Deno;
  if (name == "vercel") return EdgePlatform::Vercel;
  if (name == "lambda") return EdgePlatform::Lambda;
  if (name == "bun") return EdgePlatform::Bun;
  return EdgePlatform::Cloudflare;
}

RoutePattern compile_route_pattern(std::string_view path)
{
  constexpr std::string_view k_specials = ".*+?^${}()|[]\\";
  RoutePattern out;
  std::vector<std::string> parts;
  size_t pos = 0;
  while (true) {
    const size_t slash = path.find('/', pos);
    const std::string_view seg =
      path.substr(pos, slash == std::string_view::npos ? std::string_view::npos : slash - pos);
    if (!seg.empty() && seg[0] == ':') {
      out.paramNames.emplace_back(seg.substr(1));
      parts.emplace_back("([^/]+)");
    } else if (!seg.empty() && seg[0] == '*') {
      out.paramNames.emplace_back(seg.size() > 1 ? seg.substr(1) : std::string_view("wild"));
      parts.emplace_back("(.*)");
    } else {
      std::string escaped;
      for (const char c : seg) {
        if (k_specials.find(c) != std::string_view::npos) escaped += '\\';
        escaped += c;
      }
      parts.push_back(std::move(escaped));
    }
    if (slash == std::string_view::npos) break;
    pos = slash + 1;
  }
  out.regex = "^" + join(parts, "/") + "$";
  return out;
}

namespace
{

std::string indent_lines(const std::string & code, std::string_view prefix)
{
  std::string out;
  size_t pos = 0;
  while (pos <= code.size()) {
    const size_t nl = code.find('\n', pos);
    const std::string_view line(
      code.data() + pos, (nl == std::string::npos ? code.size() : nl) - pos);
    if (!line.empty()) {
      out += prefix;
      out += line;
    }
    if (nl == std::string::npos) break;
    out += '\n';
    pos = nl + 1;
  }
  return out;
}

std::string_view binding_label(EdgeBindingKind kind) noexcept
{
  switch (kind) {
    case EdgeBindingKind::Kv:
      return "KV";
    case EdgeBindingKind::Sql:
      return "SQL";
    case EdgeBindingKind::Storage:
      return "Object storage";
    case EdgeBindingKind::Queue:
      return "Queues";
    default:
      return "This binding";
  }
}

}  // namespace

EdgeEmitter::Config EdgeEmitter::merge(const std::vector<const NamedBlock *> & blocks)
{
  Config config;
  for (const auto * block : blocks) {
    for (const Stmt * s : block->body) {
      switch (s->get_kind()) {
        case NodeKind::ConfigField: {
          const auto * f = cast<ConfigField>(s);
          if (f->key == "target") {
            if (const auto * lit = dyn_cast<StringLiteral>(f->value)) {
              config.platform = parse_edge_platform(lit->value);
            }
          }
          break;
        }
        case NodeKind::EdgeBinding: {
          const auto * b = cast<EdgeBinding>(s);
          if (b->bindingKind == EdgeBindingKind::Env || b->bindingKind == EdgeBindingKind::Secret) {
            config.env.push_back(b);
          } else {
            config.bindings.push_back(b);
          }
          break;
        }
        case NodeKind::RouteDecl:
          config.routes.push_back(cast<RouteDecl>(s));
          break;
        case NodeKind::FunctionDecl:
          config.functions.push_back(cast<FunctionDecl>(s));
          break;
        case NodeKind::MiddlewareDecl:
          config.middlewares.push_back(cast<MiddlewareDecl>(s));
          break;
        default:
          config.other.push_back(s);
          break;
      }
    }
  }
  return config;
}

std::string EdgeEmitter::env_read(const EdgeBinding * b, std::string_view source)
{
  std::string read;
  if (source == "Deno") {
    read = fmt::format("Deno.env.get({})", quote_js(b->name));
  } else {
    read = fmt::format("{}.{}", source, b->name);
  }
  if (b->defaultValue != nullptr) read += " ?? " + emit_expr(b->defaultValue);
  return read;
}

std::string EdgeEmitter::emit_definitions(const Config & config)
{
  for (const auto * fn : config.functions) declare(fn->name);

  std::vector<std::string> sections;
  std::vector<std::string> lines;
  for (const auto * fn : config.functions) lines.push_back(emit_function(fn));
  if (!lines.empty()) sections.push_back(join(lines, "\n\n"));

  lines.clear();
  for (const Stmt * s : config.other) {
    std::string code = emit_stmt(s);
    if (!code.empty()) lines.push_back(std::move(code));
  }
  if (!lines.empty()) sections.push_back(join(lines, "\n"));

  lines.clear();
  for (const auto * mw : config.middlewares) lines.push_back(emit_function(mw->function));
  if (!lines.empty()) sections.push_back(join(lines, "\n\n"));

  return join(sections, "\n\n");
}

std::string EdgeEmitter::emit_route_table(const Config & config)
{
  std::vector<std::string> lines{
    "function __matchRoute(method, pathname, routes) {",
    "  for (const route of routes) {",
    "    if (route.method !== method && route.method !== \"*\") continue;",
    "    const match = route.pattern.exec(pathname);",
    "    if (!match) continue;",
    "    const params = {};",
    "    for (let i = 0; i < route.paramNames.length; i++) params[route.paramNames[i]] = match[i + 1];",
    "    return { handler: route.handler, params };",
    "  }",
    "  return null;",
    "}",
    "const __routes = [];",
  };
  for (const auto * route : config.routes) {
    std::string method(route->method);
    for (char & c : method) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    const RoutePattern pattern = compile_route_pattern(route->path);
    lines.push_back(fmt::format(
      "__routes.push({{ method: {}, pattern: new RegExp({}), paramNames: {}, handler: {} }});",
      quote_js(method), quote_js(pattern.regex), nlohmann::json(pattern.paramNames).dump(),
      emit_expr(route->handler)));
  }
  return join(lines, "\n");
}

std::string EdgeEmitter::emit_dispatch(
  const Config & config, std::string_view indent, std::string_view extra_args)
{
  std::string chain = "__handler";
  for (auto it = config.middlewares.rbegin(); it != config.middlewares.rend(); ++it) {
    chain = fmt::format("(req) => {}(req, {})", (*it)->function->name, chain);
  }

  std::vector<std::string> lines{
    "const url = new URL(request.url);",
    "const __handler = async (req) => {",
    "  const __match = __matchRoute(req.method, url.pathname, __routes);",
    "  if (!__match) return new Response(\"Not Found\", { status: 404 });",
    "  try {",
    fmt::format("    const __result = await __match.handler(req, __match.params{});", extra_args),
    "    if (__result instanceof Response) return __result;",
    "    return Response.json(__result);",
    "  } catch (e) {",
    "    return new Response(JSON.stringify({ error: e.message }), { status: 500, headers: { "
    "\"Content-Type\": \"application/json\" } });",
    "  }",
    "};",
    chain == "__handler" ? std::string("return __handler(request);")
                         : "return (" + chain + ")(request);",
  };
  return indent_lines(join(lines, "\n"), indent);
}

// ============================================================================
// Platforms
// ============================================================================

std::string EdgeEmitter::generate_cloudflare(const Config & config, const std::string & shared)
{
  std::vector<std::string> sections{"// Cloudflare Workers"};
  if (!shared.empty()) sections.push_back(shared);

  std::vector<std::string> names;
  std::vector<std::string> init;
  for (const auto * b : config.bindings) {
    names.emplace_back(b->name);
    init.push_back(fmt::format("    {} = env.{};", b->name, b->name));
  }
  for (const auto * e : config.env) {
    names.emplace_back(e->name);
    init.push_back(fmt::format("    {} = {};", e->name, env_read(e, "env")));
  }
  if (!names.empty()) sections.push_back("let " + join(names, ", ") + ";");

  std::string defs = emit_definitions(config);
  if (!defs.empty()) sections.push_back(std::move(defs));
  sections.push_back(emit_route_table(config));

  std::string handler = "export default {\n  async fetch(request, env, ctx) {\n";
  if (!init.empty()) handler += join(init, "\n") + "\n";
  handler += emit_dispatch(config, "    ", ", env") + "\n  },\n};";
  sections.push_back(std::move(handler));
  return join(sections, "\n\n") + "\n";
}

std::string EdgeEmitter::generate_deno(const Config & config, const std::string & shared)
{
  std::vector<std::string> sections{"// Deno Deploy"};
  if (!shared.empty()) sections.push_back(shared);

  std::vector<std::string> lines;
  std::string first_kv;
  for (const auto * b : config.bindings) {
    if (b->bindingKind == EdgeBindingKind::Kv) {
      if (first_kv.empty()) {
        first_kv = std::string(b->name);
        lines.push_back(fmt::format("const {} = await Deno.openKv();", b->name));
      } else {
        lines.push_back(fmt::format("const {} = {};", b->name, first_kv));
      }
      continue;
    }
    lines.push_back(fmt::format(
      "const {} = null; // {} is not available on Deno Deploy", b->name, binding_label(b->bindingKind)));
  }
  for (const auto * e : config.env) {
    lines.push_back(fmt::format("const {} = {};", e->name, env_read(e, "Deno")));
  }
  if (!lines.empty()) sections.push_back(join(lines, "\n"));

  std::string defs = emit_definitions(config);
  if (!defs.empty()) sections.push_back(std::move(defs));
  sections.push_back(emit_route_table(config));
  sections.push_back(
    "Deno.serve(async (request) => {\n" + emit_dispatch(config, "  ", "") + "\n});");
  return join(sections, "\n\n") + "\n";
}

std::string EdgeEmitter::generate_vercel(const Config & config, const std::string & shared)
{
  std::vector<std::string> sections{
    "// Vercel Edge", "export const config = { runtime: \"edge\" };"};
  if (!shared.empty()) sections.push_back(shared);

  std::vector<std::string> lines;
  for (const auto * b : config.bindings) {
    lines.push_back(fmt::format(
      "const {} = null; // {} is not available on Vercel Edge", b->name, binding_label(b->bindingKind)));
  }
  for (const auto * e : config.env) {
    lines.push_back(fmt::format("const {} = {};", e->name, env_read(e, "process.env")));
  }
  if (!lines.empty()) sections.push_back(join(lines, "\n"));

  std::string defs = emit_definitions(config);
  if (!defs.empty()) sections.push_back(std::move(defs));
  sections.push_back(emit_route_table(config));
  sections.push_back(
    "export default async function handler(request) {\n" + emit_dispatch(config, "  ", "") + "\n}");
  return join(sections, "\n\n") + "\n";
}

std::string EdgeEmitter::generate_lambda(const Config & config, const std::string & shared)
{
  std::vector<std::string> sections{"// AWS Lambda"};
  if (!shared.empty()) sections.push_back(shared);

  std::vector<std::string> lines;
  for (const auto * b : config.bindings) {
    lines.push_back(fmt::format(
      "const {} = null; // {} is not available on AWS Lambda", b->name, binding_label(b->bindingKind)));
  }
  for (const auto * e : config.env) {
    lines.push_back(fmt::format("const {} = {};", e->name, env_read(e, "process.env")));
  }
  if (!lines.empty()) sections.push_back(join(lines, "\n"));

  std::string defs = emit_definitions(config);
  if (!defs.empty()) sections.push_back(std::move(defs));
  sections.push_back(emit_route_table(config));

  // API Gateway events are adapted to a minimal Request-like object.
  sections.emplace_back(
    "export const handler = async (event, context) => {\n"
    "  const method = event.httpMethod || (event.requestContext && event.requestContext.http && "
    "event.requestContext.http.method) || \"GET\";\n"
    "  const path = event.path || event.rawPath || \"/\";\n"
    "  const headers = event.headers || {};\n"
    "  const body = event.body ? (event.isBase64Encoded ? Buffer.from(event.body, "
    "\"base64\").toString() : event.body) : null;\n"
    "  const request = { method, path, headers, body, json: () => JSON.parse(body || \"{}\"), url: "
    "\"https://lambda.local\" + path };\n"
    "  const __match = __matchRoute(method, path, __routes);\n"
    "  if (!__match) return { statusCode: 404, body: \"Not Found\" };\n"
    "  try {\n"
    "    const __result = await __match.handler(request, __match.params);\n"
    "    if (__result && __result.statusCode) return __result;\n"
    "    return { statusCode: 200, headers: { \"Content-Type\": \"application/json\" }, body: "
    "JSON.stringify(__result) };\n"
    "  } catch (e) {\n"
    "    return { statusCode: 500, headers: { \"Content-Type\": \"application/json\" }, body: "
    "JSON.stringify({ error: e.message }) };\n"
    "  }\n"
    "};");
  return join(sections, "\n\n") + "\n";
}

std::string EdgeEmitter::generate_bun(const Config & config, const std::string & shared)
{
  std::vector<std::string> sections{"// Bun"};

  bool has_sql = false;
  std::vector<std::string> lines;
  for (const auto * b : config.bindings) {
    if (b->bindingKind == EdgeBindingKind::Sql) {
      has_sql = true;
      lines.push_back(fmt::format("const {} = new Database(\"{}.sqlite\");", b->name, b->name));
      continue;
    }
    lines.push_back(fmt::format(
      "const {} = null; // {} is not available on Bun", b->name, binding_label(b->bindingKind)));
  }
  for (const auto * e : config.env) {
    lines.push_back(fmt::format("const {} = {};", e->name, env_read(e, "process.env")));
  }

  if (has_sql) sections.emplace_back("import { Database } from \"bun:sqlite\";");
  if (!shared.empty()) sections.push_back(shared);
  if (!lines.empty()) sections.push_back(join(lines, "\n"));

  std::string defs = emit_definitions(config);
  if (!defs.empty()) sections.push_back(std::move(defs));
  sections.push_back(emit_route_table(config));
  sections.push_back(
    "Bun.serve({\n  port: process.env.PORT || 3000,\n  async fetch(request) {\n" +
    emit_dispatch(config, "    ", "") + "\n  },\n});");
  return join(sections, "\n\n") + "\n";
}

std::string EdgeEmitter::generate(
  const std::vector<const NamedBlock *> & blocks, const std::string & shared)
{
  const Config config = merge(blocks);
  switch (config.platform) {
    case EdgePlatform::Deno:
      return generate_deno(config, shared);
    case EdgePlatform::Vercel:
      return generate_vercel(config, shared);
    case EdgePlatform::Lambda:
      return generate_lambda(config, shared);
    case EdgePlatform::Bun:
      return generate_bun(config, shared);
    case EdgePlatform::Cloudflare:
      break;
  }
  return generate_cloudflare(config, shared);
}

}  // namespace tova::codegen
