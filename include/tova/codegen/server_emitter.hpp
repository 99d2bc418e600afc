// tova/codegen/server_emitter.hpp - Hono server output
#pragma once

#include <string>
#include <vector>

#include "tova/codegen/base_emitter.hpp"

namespace tova::codegen
{

/// Functions declared directly in `server` blocks, in source order. Each
/// gets an RPC endpoint on the server and a stub on the client.
[[nodiscard]] std::vector<const FunctionDecl *> server_functions(
  const std::vector<const NamedBlock *> & blocks);

class ServerEmitter : public BaseEmitter
{
public:
  explicit ServerEmitter(EmitContext & ctx) : BaseEmitter(ctx) {}

  /**
   * Whole server module: Hono imports, shared code, app setup, the
   * security policy, middleware, server functions with one
   * `POST /rpc/<fn>` endpoint each, explicit routes and the port export.
   */
  std::string generate(
    const std::vector<const NamedBlock *> & blocks, const std::string & shared,
    const std::vector<const NamedBlock *> & security);

protected:
  std::string emit_region_member(const Stmt * stmt) override;

private:
  std::string emit_rpc_endpoint(const FunctionDecl * fn);
  std::string emit_route(const RouteDecl * route);
};

}  // namespace tova::codegen
