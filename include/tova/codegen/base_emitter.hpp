// tova/codegen/base_emitter.hpp - Expression/statement lowering shared by all targets
//
// BaseEmitter turns AST expressions, statements, patterns and plain
// declarations into JavaScript text. Target emitters derive from it and
// override the hooks that differ (identifier reads, assignments, JSX,
// region members).
//
#pragma once

#include <gsl/span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "tova/ast/ast.hpp"
#include "tova/codegen/emit_context.hpp"

namespace tova::codegen
{

/// snake_case name of a node kind, for defect messages.
[[nodiscard]] std::string_view node_kind_name(NodeKind kind) noexcept;

/// JS string literal for `s` (double-quoted, JSON escaping).
[[nodiscard]] std::string quote_js(std::string_view s);

/// True when `s` can be used unquoted as a JS property name.
[[nodiscard]] bool is_js_identifier(std::string_view s) noexcept;

[[nodiscard]] std::string join(const std::vector<std::string> & parts, std::string_view sep);

/// `count` -> `Count`.
[[nodiscard]] std::string capitalize(std::string_view s);

/// Tova-ish rendering of a type annotation, used in comments and JSDoc.
[[nodiscard]] std::string render_type(const TypeNode * type);

/// True when `body` contains a `?` outside nested functions and lambdas.
[[nodiscard]] bool contains_propagate(gsl::span<Stmt *> body);
[[nodiscard]] bool contains_propagate(const Expr * expr);

/// True when `body` needs an async function (concurrent/select blocks).
[[nodiscard]] bool needs_async(gsl::span<Stmt *> body);

class BaseEmitter
{
public:
  explicit BaseEmitter(EmitContext & ctx);
  virtual ~BaseEmitter() = default;

  BaseEmitter(const BaseEmitter &) = delete;
  BaseEmitter & operator=(const BaseEmitter &) = delete;

  /// Lower one expression. Throws CodegenError for unknown kinds.
  virtual std::string emit_expr(const Expr * expr);

  /// Lower one statement at the current indentation (no trailing newline).
  virtual std::string emit_stmt(const Stmt * stmt);

  /// Statements joined by newlines; empty lowerings are dropped.
  std::string emit_statements(gsl::span<Stmt *> stmts);

  /**
   * Function body with an implicit return on the trailing expression (or
   * on each branch of a trailing if/else). Emitted one level deeper than
   * the current indentation.
   */
  std::string emit_body(gsl::span<Stmt *> stmts);

  /// `async` is added when `force_async` is set or the body needs it.
  std::string emit_function(const FunctionDecl * fn, bool force_async = false);

  [[nodiscard]] int indent() const noexcept { return indent_; }
  void set_indent(int level) noexcept { indent_ = level; }

protected:
  // ===========================================================================
  // Hooks
  // ===========================================================================

  virtual std::string emit_identifier(const Identifier * node);
  virtual std::string emit_assignment(const Assignment * node);
  virtual std::string emit_compound_assign(const CompoundAssign * node);
  virtual std::string emit_jsx_element(const JsxElement * node);
  virtual std::string emit_jsx_child(const AstNode * child);
  /// Append the props produced by one attribute (`bind:` yields two).
  virtual void emit_jsx_attribute(
    const JsxAttribute * attr, bool is_component, std::vector<std::string> & props);

  /// Children as one value: the single child, or a fragment.
  std::string emit_jsx_group(gsl::span<AstNode *> children);

  /// Region members (state, route, ...) that this target does not lower.
  virtual std::string emit_region_member(const Stmt * stmt);

  // ===========================================================================
  // Helpers
  // ===========================================================================

  [[nodiscard]] std::string ind() const
  {
    return std::string(static_cast<size_t>(indent_) * 2, ' ');
  }

  void push_scope() { scopes_.emplace_back(); }
  void pop_scope() { scopes_.pop_back(); }
  void declare(std::string_view name) { scopes_.back().emplace(name); }
  [[nodiscard]] bool is_declared(std::string_view name) const;

  std::string emit_params(gsl::span<Param *> params);
  /// Positional arguments, then named ones folded into one object. A `_`
  /// argument is replaced by `placeholder` when given.
  std::string emit_args(gsl::span<Expr *> args, const std::string * placeholder = nullptr);

  /// Statements one level deeper, in their own scope.
  std::string emit_block(gsl::span<Stmt *> stmts);

  /// `{`, `inner`, and a closing brace at the current indentation.
  [[nodiscard]] std::string brace(const std::string & inner) const;

  std::string emit_if_returns(const IfStmt * node);

  /// `try { body } catch (__e) { ... }` around an already-emitted body.
  std::string wrap_propagate(const std::string & body);

  std::string emit_lambda(const LambdaExpr * node);
  std::string emit_call(const CallExpr * node);
  std::string emit_pipe(const PipeExpr * node);
  std::string emit_binary(const BinaryExpr * node);
  std::string emit_template(const TemplateLiteral * node);
  std::string emit_object(const ObjectLiteral * node);
  std::string emit_slice(const SliceExpr * node);
  std::string emit_list_comprehension(const ListComprehension * node);
  std::string emit_dict_comprehension(const DictComprehension * node);
  std::string emit_match(const MatchExpr * node);
  std::string emit_if_expr(const IfExpr * node);

  std::string pattern_condition(const Pattern * pattern, const std::string & subject);
  void pattern_bindings(
    const Pattern * pattern, const std::string & subject,
    std::vector<std::pair<std::string, std::string>> & out);

  std::string emit_if(const IfStmt * node);
  std::string emit_for(const ForStmt * node);
  std::string emit_try(const TryStmt * node);
  std::string emit_var_decl(const VarDecl * node);
  std::string emit_let_destructure(const LetDestructure * node);
  std::string emit_concurrent(const ConcurrentBlock * node);
  std::string emit_select(const SelectStmt * node);
  std::string emit_type_decl(const TypeDecl * node);
  std::string emit_interface(const InterfaceDecl * node);
  std::string emit_import(const ImportDecl * node);
  std::string emit_jsdoc(const FunctionDecl * fn);

  EmitContext & ctx_;
  int indent_ = 0;
  std::vector<std::unordered_set<std::string>> scopes_;
};

}  // namespace tova::codegen
