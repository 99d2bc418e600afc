// tova/codegen/deploy_emitter.hpp - `deploy` blocks to a structured config map
#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "tova/codegen/base_emitter.hpp"

namespace tova::codegen
{

class DeployEmitter : public BaseEmitter
{
public:
  explicit DeployEmitter(EmitContext & ctx) : BaseEmitter(ctx) {}

  /**
   * One object per deploy name, keyed by that name. Blocks sharing a name
   * merge in source order (later fields win). Unset fields keep the
   * defaults: 1 instance, 512mb, branch `main`, health check `/healthz`
   * every 30s with a 5s timeout, restart on failure, 5 kept releases.
   */
  nlohmann::json generate(const std::vector<const NamedBlock *> & blocks);

  /// Literals (and arrays/objects of literals) as JSON; anything else as
  /// its JavaScript text.
  nlohmann::json to_json(const Expr * expr);

private:
  static nlohmann::json defaults();
};

}  // namespace tova::codegen
