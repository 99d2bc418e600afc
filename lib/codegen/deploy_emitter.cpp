// tova/codegen/deploy_emitter.cpp - `deploy` blocks to a structured config map
#include "tova/codegen/deploy_emitter.hpp"

#include <cstdint>

namespace tova::codegen
{

nlohmann::json DeployEmitter::defaults()
{
  return {
    {"instances", 1},
    {"memory", "512mb"},
    {"branch", "main"},
    {"health", "/healthz"},
    {"health_interval", 30},
    {"health_timeout", 5},
    {"restart_on_failure", true},
    {"keep_releases", 5},
    {"env", nlohmann::json::object()},
    {"databases", nlohmann::json::array()},
  };
}

nlohmann::json DeployEmitter::to_json(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::NumberLiteral: {
      const auto * n = cast<NumberLiteral>(expr);
      if (n->isFloat) return n->value;
      return static_cast<int64_t>(n->value);
    }
    case NodeKind::StringLiteral:
      return std::string(cast<StringLiteral>(expr)->value);
    case NodeKind::BoolLiteral:
      return cast<BoolLiteral>(expr)->value;
    case NodeKind::NilLiteral:
      return nullptr;
    case NodeKind::ArrayLiteral: {
      nlohmann::json arr = nlohmann::json::array();
      for (const Expr * e : cast<ArrayLiteral>(expr)->elements) arr.push_back(to_json(e));
      return arr;
    }
    case NodeKind::ObjectLiteral: {
      nlohmann::json obj = nlohmann::json::object();
      for (const auto * p : cast<ObjectLiteral>(expr)->properties) {
        if (p->key.empty()) continue;  // spread
        obj[std::string(p->key)] = to_json(p->value);
      }
      return obj;
    }
    default:
      return emit_expr(expr);
  }
}

nlohmann::json DeployEmitter::generate(const std::vector<const NamedBlock *> & blocks)
{
  nlohmann::json out = nlohmann::json::object();
  for (const auto * block : blocks) {
    const std::string name = block->name.empty() ? "default" : std::string(block->name);
    if (!out.contains(name)) {
      out[name] = defaults();
      out[name]["name"] = name;
    }
    nlohmann::json & config = out[name];

    for (const Stmt * s : block->body) {
      if (const auto * field = dyn_cast<ConfigField>(s)) {
        config[std::string(field->key)] = to_json(field->value);
      } else if (const auto * env = dyn_cast<DeployEnvBlock>(s)) {
        for (const auto * e : env->entries) config["env"][std::string(e->key)] = to_json(e->value);
      } else if (const auto * db = dyn_cast<DeployDbBlock>(s)) {
        nlohmann::json db_config = nlohmann::json::object();
        for (const auto * e : db->entries) db_config[std::string(e->key)] = to_json(e->value);
        config["databases"].push_back({{"engine", std::string(db->engine)}, {"config", db_config}});
      }
    }
  }
  return out;
}

}  // namespace tova::codegen
