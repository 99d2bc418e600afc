// tova/codegen/edge_emitter.hpp - Serverless/edge output, one flavour per platform
//
// Edge blocks with the same name merge into one deployment unit. The
// `target` field picks the platform (cloudflare by default); bindings,
// environment variables and secrets are lowered to what that platform
// offers, and routes go into a small regex route table.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tova/codegen/base_emitter.hpp"

namespace tova::codegen
{

enum class EdgePlatform : uint8_t {
  Cloudflare,
  Deno,
  Vercel,
  Lambda,
  Bun,
};

/// Platform named by a `target:` string; unknown names fall back to Cloudflare.
[[nodiscard]] EdgePlatform parse_edge_platform(std::string_view name) noexcept;

/// Route path to an anchored regex; `:name` and `*name` segments capture.
struct RoutePattern
{
  std::string regex;
  std::vector<std::string> paramNames;
};

[[nodiscard]] RoutePattern compile_route_pattern(std::string_view path);

class EdgeEmitter : public BaseEmitter
{
public:
  explicit EdgeEmitter(EmitContext & ctx) : BaseEmitter(ctx) {}

  std::string generate(const std::vector<const NamedBlock *> & blocks, const std::string & shared);

private:
  struct Config
  {
    EdgePlatform platform = EdgePlatform::Cloudflare;
    std::vector<const EdgeBinding *> bindings;  // kv/sql/storage/queue
    std::vector<const EdgeBinding *> env;       // env + secret
    std::vector<const RouteDecl *> routes;
    std::vector<const FunctionDecl *> functions;
    std::vector<const MiddlewareDecl *> middlewares;
    std::vector<const Stmt *> other;
  };

  static Config merge(const std::vector<const NamedBlock *> & blocks);

  std::string env_read(const EdgeBinding * b, std::string_view source);
  std::string emit_definitions(const Config & config);
  std::string emit_route_table(const Config & config);
  std::string emit_dispatch(
    const Config & config, std::string_view indent, std::string_view extra_args);

  std::string generate_cloudflare(const Config & config, const std::string & shared);
  std::string generate_deno(const Config & config, const std::string & shared);
  std::string generate_vercel(const Config & config, const std::string & shared);
  std::string generate_lambda(const Config & config, const std::string & shared);
  std::string generate_bun(const Config & config, const std::string & shared);
};

}  // namespace tova::codegen
