// tova/codegen/client_emitter.hpp - Browser output with fine-grained reactivity
//
// `state` bindings become signals, `computed` bindings become memos, and
// any JSX value that reads either is wrapped in a closure so the runtime
// can re-evaluate it. Calls to server functions go through generated RPC
// stubs.
//
#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "tova/codegen/base_emitter.hpp"

namespace tova::codegen
{

class ClientEmitter : public BaseEmitter
{
public:
  explicit ClientEmitter(EmitContext & ctx) : BaseEmitter(ctx) {}

  /**
   * Whole client module: runtime import, shared code, RPC stubs for
   * `serverFunctions`, then the client blocks grouped as signals,
   * computeds, statements, stores, components and effects, and finally
   * the auto-mount of `App` when it exists.
   */
  std::string generate(
    const std::vector<const NamedBlock *> & blocks, const std::string & shared,
    const std::vector<const FunctionDecl *> & serverFunctions);

  std::string emit_expr(const Expr * expr) override;
  std::string emit_stmt(const Stmt * stmt) override;

protected:
  std::string emit_identifier(const Identifier * node) override;
  std::string emit_assignment(const Assignment * node) override;
  std::string emit_compound_assign(const CompoundAssign * node) override;
  void emit_jsx_attribute(
    const JsxAttribute * attr, bool is_component, std::vector<std::string> & props) override;
  std::string emit_jsx_child(const AstNode * child) override;
  std::string emit_region_member(const Stmt * stmt) override;

private:
  [[nodiscard]] bool is_state(std::string_view name) const;
  [[nodiscard]] bool is_tracked(std::string_view name) const;

  /// True when evaluating `node` reads a signal or computed value.
  [[nodiscard]] bool reads_tracked(const AstNode * node) const;

  std::string emit_signal(const StateDecl * node);
  std::string emit_computed(const ComputedDecl * node);
  std::string emit_effect(const EffectDecl * node);
  std::string emit_component(const ComponentDecl * node);
  std::string emit_store(const StoreDecl * node);
  std::string emit_rpc_stubs(const std::vector<const FunctionDecl *> & serverFunctions);

  std::unordered_set<std::string> stateNames_;
  std::unordered_set<std::string> computedNames_;
  bool awaitRpc_ = false;
};

}  // namespace tova::codegen
