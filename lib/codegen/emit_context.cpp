// tova/codegen/emit_context.cpp - Tree-shaking pre-pass
#include "tova/codegen/emit_context.hpp"

#include "tova/ast/visitor.hpp"
#include "tova/codegen/stdlib.hpp"

namespace tova::codegen
{

EmitContext::EmitContext()
{
  variantFields["Ok"] = {"value"};
  variantFields["Some"] = {"value"};
  variantFields["Err"] = {"error"};
}

void EmitContext::use(std::string_view name)
{
  if (is_user_defined(name)) return;
  usedBuiltins.emplace(name);
}

const std::vector<std::string> & EmitContext::field_names(std::string_view variant) const
{
  static const std::vector<std::string> k_none;
  auto it = variantFields.find(std::string(variant));
  return it == variantFields.end() ? k_none : it->second;
}

namespace
{

// ============================================================================
// User definitions
// ============================================================================

void collect_definitions(gsl::span<Stmt *> body, EmitContext & ctx)
{
  for (const Stmt * stmt : body) {
    switch (stmt->get_kind()) {
      case NodeKind::FunctionDecl:
        ctx.define(cast<FunctionDecl>(stmt)->name);
        break;
      case NodeKind::MiddlewareDecl:
        ctx.define(cast<MiddlewareDecl>(stmt)->function->name);
        break;
      case NodeKind::TypeDecl: {
        const auto * td = cast<TypeDecl>(stmt);
        ctx.define(td->name);
        for (const auto * v : td->variants) {
          ctx.define(v->name);
          std::vector<std::string> fields;
          fields.reserve(v->fields.size());
          for (const auto * f : v->fields) fields.emplace_back(f->name);
          ctx.set_variant_fields(v->name, std::move(fields));
        }
        break;
      }
      case NodeKind::ImportDecl: {
        const auto * imp = cast<ImportDecl>(stmt);
        if (!imp->defaultName.empty()) ctx.define(imp->defaultName);
        for (size_t i = 0; i < imp->names.size(); ++i) ctx.define(imp->local_name(i));
        break;
      }
      case NodeKind::Assignment:
        for (const Expr * t : cast<Assignment>(stmt)->targets) {
          if (const auto * id = dyn_cast<Identifier>(t)) ctx.define(id->name);
        }
        break;
      case NodeKind::VarDecl:
        for (const auto name : cast<VarDecl>(stmt)->names) ctx.define(name);
        break;
      case NodeKind::LetDestructure:
        for (const auto name : cast<LetDestructure>(stmt)->names) ctx.define(name);
        break;
      case NodeKind::StateDecl:
        ctx.define(cast<StateDecl>(stmt)->name);
        break;
      case NodeKind::ComputedDecl:
        ctx.define(cast<ComputedDecl>(stmt)->name);
        break;
      case NodeKind::ComponentDecl:
        ctx.define(cast<ComponentDecl>(stmt)->name);
        break;
      case NodeKind::StoreDecl:
        ctx.define(cast<StoreDecl>(stmt)->name);
        break;
      case NodeKind::NamedBlock:
        collect_definitions(cast<NamedBlock>(stmt)->body, ctx);
        break;
      default:
        break;
    }
  }
}

// ============================================================================
// References
// ============================================================================

class UsageCollector : public ConstRecursiveAstVisitor<UsageCollector>
{
  using Base = ConstRecursiveAstVisitor<UsageCollector>;

public:
  explicit UsageCollector(EmitContext & ctx) : ctx_(ctx) {}

  bool visit_identifier(const Identifier * node)
  {
    if (stdlib::is_user_visible(node->name)) ctx_.use(node->name);
    return true;
  }

  bool visit_membership_expr(const MembershipExpr * node)
  {
    ctx_.use("__contains");
    return Base::visit_membership_expr(node);
  }

  bool visit_propagate_expr(const PropagateExpr * node)
  {
    ctx_.use("__propagate");
    return Base::visit_propagate_expr(node);
  }

  bool visit_spawn_expr(const SpawnExpr * node)
  {
    ctx_.use("__spawn");
    return Base::visit_spawn_expr(node);
  }

  bool visit_concurrent_block(const ConcurrentBlock * node)
  {
    switch (node->mode) {
      case ConcurrentMode::All:
        break;
      case ConcurrentMode::CancelOnError:
        ctx_.use("__gather_cancel_on_error");
        break;
      case ConcurrentMode::First:
        ctx_.use("__gather_first");
        break;
    }
    if (node->timeout != nullptr) ctx_.use("__with_timeout");
    return Base::visit_concurrent_block(node);
  }

  // Assignment targets are not part of the default walk.
  bool visit_assignment(const Assignment * node)
  {
    for (const Expr * t : node->targets) {
      if (!isa<Identifier>(t) && !visit(t)) return false;
    }
    return Base::visit_assignment(node);
  }

private:
  EmitContext & ctx_;
};

}  // namespace

void collect_usage(const Program & program, EmitContext & ctx)
{
  collect_definitions(program.body, ctx);
  UsageCollector collector(ctx);
  collector.visit(&program);
}

}  // namespace tova::codegen
