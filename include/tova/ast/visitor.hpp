// tova/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// This header provides a visitor pattern implementation using CRTP
// (Curiously Recurring Template Pattern) for type-safe AST traversal.
//
#pragma once

#include <type_traits>

#include "tova/ast/ast.hpp"
#include "tova/ast/ast_enums.hpp"
#include "tova/basic/casting.hpp"

namespace tova
{

// ============================================================================
// Type Traits for Const-Aware Node Pointer
// ============================================================================

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements `visit_<snake>` for the node types it cares
 * about. Unhandled nodes fall back to the category method (`visit_expr`,
 * `visit_stmt`, ...), which the derived class may also override, and
 * finally to `visit_node`.
 *
 * Usage:
 * @code
 *   class NameCollector : public ConstAstVisitor<NameCollector> {
 *   public:
 *     void visit_identifier(const Identifier * node) { names.push_back(node->name); }
 *     std::vector<std::string_view> names;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT The node pointer type (AstNode* or const AstNode*)
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  // ===========================================================================
  // Main dispatch method
  // ===========================================================================

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_DISPATCH(Class, Kind, Snake) \
  case NodeKind::Kind:                        \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR AST_NODE_DISPATCH
#define AST_NODE_TYPE AST_NODE_DISPATCH
#define AST_NODE_STMT AST_NODE_DISPATCH
#define AST_NODE_DECL AST_NODE_DISPATCH
#define AST_NODE_PATTERN AST_NODE_DISPATCH
#define AST_NODE_SUPPORT AST_NODE_DISPATCH
#define AST_NODE_TOP AST_NODE_DISPATCH
#include "tova/ast/ast_nodes.def"
#undef AST_NODE_DISPATCH
    }

    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (auto-generated from X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#include "tova/ast/ast_nodes.def"

#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#include "tova/ast/ast_nodes.def"

#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#include "tova/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#include "tova/ast/ast_nodes.def"

#define AST_NODE_PATTERN(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_pattern(node);                               \
  }
#include "tova/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "tova/ast/ast_nodes.def"

#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "tova/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods (for grouping behavior)
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_stmt(node);
  }
  ReturnType visit_pattern(detail::propagate_const_t<NodePtrT, Pattern> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that automatically traverses child nodes.
 *
 * Override specific visit methods to customize behavior. Call the base
 * implementation to continue traversal, or skip it to prune the subtree.
 * Returning false aborts the whole walk.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Leaves and anything without children
  bool visit_node(NodePtrT /*node*/) { return true; }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  bool visit_template_literal(NodePtr<TemplateLiteral> node) { return visit_all(node->parts); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return get_derived().visit(node->operand); }

  bool visit_chained_comparison(NodePtr<ChainedComparison> node)
  {
    return visit_all(node->operands);
  }

  bool visit_membership_expr(NodePtr<MembershipExpr> node)
  {
    return get_derived().visit(node->value) && get_derived().visit(node->collection);
  }

  bool visit_range_expr(NodePtr<RangeExpr> node)
  {
    return get_derived().visit(node->start) && get_derived().visit(node->end);
  }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    return get_derived().visit(node->callee) && visit_all(node->args);
  }

  bool visit_named_argument(NodePtr<NamedArgument> node)
  {
    return get_derived().visit(node->value);
  }

  bool visit_member_expr(NodePtr<MemberExpr> node) { return get_derived().visit(node->object); }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    return get_derived().visit(node->object) && get_derived().visit(node->index);
  }

  bool visit_slice_expr(NodePtr<SliceExpr> node)
  {
    return get_derived().visit(node->object) && visit_opt(node->start) &&
           visit_opt(node->end) && visit_opt(node->step);
  }

  bool visit_propagate_expr(NodePtr<PropagateExpr> node)
  {
    return get_derived().visit(node->operand);
  }

  bool visit_await_expr(NodePtr<AwaitExpr> node) { return get_derived().visit(node->operand); }

  bool visit_spread_expr(NodePtr<SpreadExpr> node) { return get_derived().visit(node->operand); }

  bool visit_lambda_expr(NodePtr<LambdaExpr> node)
  {
    if (!visit_all(node->params)) return false;
    if (node->isBlock) return visit_all(node->body);
    return get_derived().visit(node->bodyExpr);
  }

  bool visit_match_expr(NodePtr<MatchExpr> node)
  {
    return get_derived().visit(node->subject) && visit_all(node->arms);
  }

  bool visit_if_expr(NodePtr<IfExpr> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->thenBody) &&
           visit_all(node->elifs) && visit_all(node->elseBody);
  }

  bool visit_array_literal(NodePtr<ArrayLiteral> node) { return visit_all(node->elements); }

  bool visit_object_literal(NodePtr<ObjectLiteral> node) { return visit_all(node->properties); }

  bool visit_list_comprehension(NodePtr<ListComprehension> node)
  {
    return get_derived().visit(node->iterable) && visit_opt(node->condition) &&
           get_derived().visit(node->element);
  }

  bool visit_dict_comprehension(NodePtr<DictComprehension> node)
  {
    return get_derived().visit(node->iterable) && visit_opt(node->condition) &&
           get_derived().visit(node->key) && get_derived().visit(node->value);
  }

  bool visit_tuple_expr(NodePtr<TupleExpr> node) { return visit_all(node->elements); }

  bool visit_pipe_expr(NodePtr<PipeExpr> node)
  {
    return get_derived().visit(node->lhs) && get_derived().visit(node->rhs);
  }

  bool visit_spawn_expr(NodePtr<SpawnExpr> node) { return get_derived().visit(node->operand); }

  bool visit_jsx_element(NodePtr<JsxElement> node)
  {
    return visit_all(node->attributes) && visit_all(node->children);
  }

  // ===========================================================================
  // Types
  // ===========================================================================

  bool visit_named_type(NodePtr<NamedType> node) { return visit_all(node->typeArgs); }

  bool visit_array_type(NodePtr<ArrayType> node)
  {
    return get_derived().visit(node->elementType);
  }

  bool visit_tuple_type(NodePtr<TupleType> node) { return visit_all(node->elements); }

  bool visit_function_type(NodePtr<FunctionType> node)
  {
    return visit_all(node->params) && visit_opt(node->returnType);
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return get_derived().visit(node->expr); }

  bool visit_assignment(NodePtr<Assignment> node)
  {
    return visit_opt(node->type) && visit_all(node->values);
  }

  bool visit_var_decl(NodePtr<VarDecl> node)
  {
    return visit_opt(node->type) && visit_all(node->values);
  }

  bool visit_let_destructure(NodePtr<LetDestructure> node)
  {
    return get_derived().visit(node->value);
  }

  bool visit_compound_assign(NodePtr<CompoundAssign> node)
  {
    return get_derived().visit(node->target) && get_derived().visit(node->value);
  }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->thenBody) &&
           visit_all(node->elifs) && visit_all(node->elseBody);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    return get_derived().visit(node->iterable) && visit_all(node->body) &&
           visit_all(node->elseBody);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->body);
  }

  bool visit_try_stmt(NodePtr<TryStmt> node)
  {
    return visit_all(node->body) && visit_all(node->catchBody) && visit_all(node->finallyBody);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return visit_opt(node->value); }

  bool visit_guard_stmt(NodePtr<GuardStmt> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->elseBody);
  }

  bool visit_concurrent_block(NodePtr<ConcurrentBlock> node)
  {
    return visit_opt(node->timeout) && visit_all(node->body);
  }

  bool visit_select_stmt(NodePtr<SelectStmt> node) { return visit_all(node->cases); }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    return visit_all(node->params) && visit_opt(node->returnType) && visit_all(node->body);
  }

  bool visit_type_decl(NodePtr<TypeDecl> node)
  {
    return visit_all(node->variants) && visit_all(node->fields);
  }

  bool visit_type_alias_decl(NodePtr<TypeAliasDecl> node)
  {
    return get_derived().visit(node->aliasedType);
  }

  bool visit_interface_decl(NodePtr<InterfaceDecl> node) { return visit_all(node->members); }

  bool visit_named_block(NodePtr<NamedBlock> node) { return visit_all(node->body); }

  bool visit_state_decl(NodePtr<StateDecl> node)
  {
    return visit_opt(node->type) && get_derived().visit(node->init);
  }

  bool visit_computed_decl(NodePtr<ComputedDecl> node) { return get_derived().visit(node->expr); }

  bool visit_effect_decl(NodePtr<EffectDecl> node) { return visit_all(node->body); }

  bool visit_component_decl(NodePtr<ComponentDecl> node)
  {
    return visit_all(node->params) && visit_all(node->body);
  }

  bool visit_store_decl(NodePtr<StoreDecl> node) { return visit_all(node->body); }

  bool visit_route_decl(NodePtr<RouteDecl> node) { return get_derived().visit(node->handler); }

  bool visit_middleware_decl(NodePtr<MiddlewareDecl> node)
  {
    return get_derived().visit(node->function);
  }

  bool visit_config_field(NodePtr<ConfigField> node) { return get_derived().visit(node->value); }

  bool visit_edge_binding(NodePtr<EdgeBinding> node) { return visit_opt(node->defaultValue); }

  bool visit_deploy_env_block(NodePtr<DeployEnvBlock> node) { return visit_all(node->entries); }

  bool visit_deploy_db_block(NodePtr<DeployDbBlock> node) { return visit_all(node->entries); }

  bool visit_security_auth(NodePtr<SecurityAuth> node) { return visit_all(node->entries); }

  bool visit_security_protect(NodePtr<SecurityProtect> node) { return visit_all(node->entries); }

  // ===========================================================================
  // Patterns and supporting nodes
  // ===========================================================================

  bool visit_literal_pattern(NodePtr<LiteralPattern> node)
  {
    return get_derived().visit(node->literal);
  }

  bool visit_range_pattern(NodePtr<RangePattern> node)
  {
    return get_derived().visit(node->start) && get_derived().visit(node->end);
  }

  bool visit_variant_pattern(NodePtr<VariantPattern> node) { return visit_all(node->fields); }

  bool visit_array_pattern(NodePtr<ArrayPattern> node) { return visit_all(node->elements); }

  bool visit_tuple_pattern(NodePtr<TuplePattern> node) { return visit_all(node->elements); }

  bool visit_param(NodePtr<Param> node)
  {
    return visit_opt(node->type) && visit_opt(node->defaultValue);
  }

  bool visit_match_arm(NodePtr<MatchArm> node)
  {
    if (!get_derived().visit(node->pattern) || !visit_opt(node->guard)) return false;
    if (node->isBlock) return visit_all(node->body);
    return get_derived().visit(node->bodyExpr);
  }

  bool visit_elif_clause(NodePtr<ElifClause> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->body);
  }

  bool visit_type_variant(NodePtr<TypeVariant> node) { return visit_all(node->fields); }

  bool visit_type_field(NodePtr<TypeField> node) { return visit_opt(node->type); }

  bool visit_object_property(NodePtr<ObjectProperty> node)
  {
    return get_derived().visit(node->value);
  }

  bool visit_select_case(NodePtr<SelectCase> node)
  {
    return visit_opt(node->channel) && visit_opt(node->value) && visit_all(node->body);
  }

  bool visit_jsx_attribute(NodePtr<JsxAttribute> node) { return visit_opt(node->value); }

  bool visit_jsx_expr_child(NodePtr<JsxExprChild> node) { return get_derived().visit(node->expr); }

  bool visit_jsx_for(NodePtr<JsxFor> node)
  {
    return get_derived().visit(node->iterable) && visit_opt(node->key) &&
           visit_all(node->children);
  }

  bool visit_jsx_if(NodePtr<JsxIf> node)
  {
    return get_derived().visit(node->condition) && visit_all(node->children) &&
           visit_all(node->elifs) && visit_all(node->elseChildren);
  }

  bool visit_program(NodePtr<Program> node) { return visit_all(node->body); }

protected:
  template <typename T>
  bool visit_all(gsl::span<T *> nodes)
  {
    for (auto * n : nodes) {
      if (!get_derived().visit(n)) return false;
    }
    return true;
  }

  template <typename T>
  bool visit_opt(T * node)
  {
    return node == nullptr || get_derived().visit(node);
  }
};

/// Alias for const recursive AST traversal
template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace tova
