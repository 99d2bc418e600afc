// tova/sema/analyzer.hpp - Scope building, gradual type checking and lints
//
// One walk over the Program builds the scope chain, resolves bindings,
// infers and checks types (setting Expr::resolvedType) and collects
// diagnostics.
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "tova/ast/ast.hpp"
#include "tova/ast/visitor.hpp"
#include "tova/basic/diagnostic.hpp"
#include "tova/sema/resolution/symbol_table.hpp"
#include "tova/sema/types/type.hpp"
#include "tova/sema/types/type_table.hpp"

namespace tova
{

struct AnalyzerOptions
{
  /// Return errors in the result instead of throwing AnalysisError
  bool tolerant = false;
  /// Promote operand and reassignment mismatches from warnings to errors
  bool strict = false;
};

struct AnalysisResult
{
  std::vector<Diagnostic> warnings;
  std::vector<Diagnostic> errors;
};

/**
 * Semantic analyzer for Tova programs.
 *
 * Checking is gradual: an Unknown or Any type on either side of a check
 * suppresses the diagnostic. Only annotated boundaries (call arguments,
 * returns, typed bindings) produce errors; operator misuse is a warning
 * unless AnalyzerOptions::strict is set.
 *
 * Visit methods for expressions return the inferred type; statement and
 * declaration visits return nullptr.
 */
class Analyzer : public AstVisitor<Analyzer, const Type *>
{
public:
  explicit Analyzer(const SourceManager & sm, AnalyzerOptions options = {});

  /**
   * Analyze a whole program.
   *
   * @throws AnalysisError when errors were found and the analyzer is not
   *         tolerant
   */
  AnalysisResult analyze(Program * program);

  [[nodiscard]] TypeContext & types() noexcept { return types_; }
  [[nodiscard]] const TypeTable & type_table() const noexcept { return typeTable_; }
  [[nodiscard]] const DiagnosticBag & diagnostics() const noexcept { return diags_; }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  const Type * visit_number_literal(NumberLiteral * node);
  const Type * visit_string_literal(StringLiteral * node);
  const Type * visit_template_literal(TemplateLiteral * node);
  const Type * visit_bool_literal(BoolLiteral * node);
  const Type * visit_nil_literal(NilLiteral * node);
  const Type * visit_identifier(Identifier * node);
  const Type * visit_binary_expr(BinaryExpr * node);
  const Type * visit_unary_expr(UnaryExpr * node);
  const Type * visit_chained_comparison(ChainedComparison * node);
  const Type * visit_membership_expr(MembershipExpr * node);
  const Type * visit_range_expr(RangeExpr * node);
  const Type * visit_call_expr(CallExpr * node);
  const Type * visit_named_argument(NamedArgument * node);
  const Type * visit_member_expr(MemberExpr * node);
  const Type * visit_index_expr(IndexExpr * node);
  const Type * visit_slice_expr(SliceExpr * node);
  const Type * visit_propagate_expr(PropagateExpr * node);
  const Type * visit_await_expr(AwaitExpr * node);
  const Type * visit_spread_expr(SpreadExpr * node);
  const Type * visit_lambda_expr(LambdaExpr * node);
  const Type * visit_match_expr(MatchExpr * node);
  const Type * visit_if_expr(IfExpr * node);
  const Type * visit_array_literal(ArrayLiteral * node);
  const Type * visit_object_literal(ObjectLiteral * node);
  const Type * visit_list_comprehension(ListComprehension * node);
  const Type * visit_dict_comprehension(DictComprehension * node);
  const Type * visit_tuple_expr(TupleExpr * node);
  const Type * visit_pipe_expr(PipeExpr * node);
  const Type * visit_spawn_expr(SpawnExpr * node);
  const Type * visit_jsx_element(JsxElement * node);

  // ===========================================================================
  // Statements
  // ===========================================================================

  const Type * visit_expr_stmt(ExprStmt * node);
  const Type * visit_assignment(Assignment * node);
  const Type * visit_var_decl(VarDecl * node);
  const Type * visit_let_destructure(LetDestructure * node);
  const Type * visit_compound_assign(CompoundAssign * node);
  const Type * visit_if_stmt(IfStmt * node);
  const Type * visit_for_stmt(ForStmt * node);
  const Type * visit_while_stmt(WhileStmt * node);
  const Type * visit_try_stmt(TryStmt * node);
  const Type * visit_return_stmt(ReturnStmt * node);
  const Type * visit_break_stmt(BreakStmt * node);
  const Type * visit_continue_stmt(ContinueStmt * node);
  const Type * visit_guard_stmt(GuardStmt * node);
  const Type * visit_concurrent_block(ConcurrentBlock * node);
  const Type * visit_select_stmt(SelectStmt * node);

  // ===========================================================================
  // Declarations
  // ===========================================================================

  const Type * visit_function_decl(FunctionDecl * node);
  const Type * visit_import_decl(ImportDecl * node);
  const Type * visit_named_block(NamedBlock * node);
  const Type * visit_state_decl(StateDecl * node);
  const Type * visit_computed_decl(ComputedDecl * node);
  const Type * visit_effect_decl(EffectDecl * node);
  const Type * visit_component_decl(ComponentDecl * node);
  const Type * visit_store_decl(StoreDecl * node);
  const Type * visit_route_decl(RouteDecl * node);
  const Type * visit_middleware_decl(MiddlewareDecl * node);
  const Type * visit_edge_binding(EdgeBinding * node);

  /// Type, alias and interface declarations are registered before the
  /// walk; config, deploy and security entries carry no checked code.
  const Type * visit_decl(Decl * /*node*/) { return nullptr; }

private:
  struct FunctionFrame
  {
    const Type * returnType;  ///< nullptr when unannotated
    bool isAsync;
  };

  // Expression entry point: visits, defaults to Unknown and records the
  // result on the node.
  const Type * check_expr(Expr * expr);
  const Type * check_call(CallExpr * node, size_t implicit_args);
  const Type * check_builtin_call(std::string_view name, const std::vector<const Type *> & args);

  void check_binary_operands(BinaryExpr * node, const Type * lhs, const Type * rhs);
  void check_arity(CallExpr * node, std::string_view name, const Symbol & fn, size_t implicit_args);
  void check_argument_types(CallExpr * node, const Symbol & fn, size_t implicit_args);

  // Blocks and declarations
  void analyze_block(gsl::span<Stmt *> body);
  void analyze_scoped_block(gsl::span<Stmt *> body, bool is_loop = false);
  void analyze_function_body(
    std::string_view name, gsl::span<Stmt *> body, const Type * return_type, SourceRange range);
  void hoist_declarations(gsl::span<Stmt *> body, Scope & target);
  void declare_types(gsl::span<Stmt *> body, Scope & target);
  void declare_type_name(const Decl * decl, Scope & target);
  void resolve_type_decl(const Decl * decl, Scope & target);
  void define_params(gsl::span<Param *> params, gsl::span<const std::string_view> type_params);
  Symbol make_function_symbol(const FunctionDecl * fn);
  void define_binding(
    std::string_view name, SymbolKind kind, const Type * type, bool is_mutable,
    SourceRange range, std::string_view naming_label);

  // Patterns
  void bind_pattern(Pattern * pattern, const Type * expected);
  void check_exhaustiveness(MatchExpr * node, const Type * subject_type);

  // Scopes
  void enter_scope(Scope & scope);
  void leave_scope(Scope & scope, Scope * saved);
  void report_unused(Scope & scope);
  [[nodiscard]] bool inside_loop() const;

  // Diagnostics
  void error(
    SourceRange range, std::string message, std::string_view code = {},
    std::optional<std::string> hint = std::nullopt);
  void warning(
    SourceRange range, std::string message, std::string_view code = {},
    std::optional<std::string> hint = std::nullopt);
  /// Error in strict mode, warning otherwise.
  void strict_error(
    SourceRange range, std::string message, std::string_view code = {},
    std::optional<std::string> hint = std::nullopt);
  void check_naming(std::string_view name, std::string_view label, bool pascal, SourceRange range);
  [[nodiscard]] std::optional<std::string> suggest(std::string_view name) const;

  [[nodiscard]] const Type * resolve(
    const TypeNode * node, gsl::span<const std::string_view> type_params = {});
  [[nodiscard]] const Type * element_type_of(const Type * iterable);

  const SourceManager & sm_;
  AnalyzerOptions options_;
  TypeContext types_;
  TypeTable typeTable_;
  DiagnosticBag diags_;

  Scope * current_scope_ = nullptr;
  Scope * module_scope_ = nullptr;
  std::vector<FunctionFrame> frames_;
  std::unordered_set<const AstNode *> declaredTypes_;
};

}  // namespace tova
