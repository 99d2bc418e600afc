// tova/syntax/parser.hpp - Recursive-descent parser for Tova
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tova/ast/ast.hpp"
#include "tova/ast/ast_context.hpp"
#include "tova/basic/source_manager.hpp"
#include "tova/syntax/token.hpp"

namespace tova::syntax
{

/**
 * Builds an AST from a token sequence produced by Lexer.
 *
 * Expressions use precedence climbing; region grammars are dispatched
 * through BlockRegistry. The first grammar violation throws ParseError;
 * there is no recovery.
 */
class Parser
{
public:
  Parser(AstContext & ast, const SourceManager & sm, std::vector<Token> tokens)
  : ast_(ast), sm_(sm), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

  /// Parse exactly one expression spanning the whole token run.
  [[nodiscard]] Expr * parse_standalone_expr();

  // ===========================================================================
  // Region grammars (registered in BlockRegistry)
  // ===========================================================================

  Stmt * parse_client_block();
  Stmt * parse_server_block();
  Stmt * parse_shared_block();
  Stmt * parse_edge_block();
  Stmt * parse_deploy_block();
  Stmt * parse_security_block();
  Stmt * parse_cli_block();
  Stmt * parse_concurrent_block();
  Stmt * parse_select_stmt();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_ident(std::string_view text, size_t lookahead = 0) const;
  [[nodiscard]] bool same_line_as_prev() const;

  const Token & advance();
  bool match(TokenKind k);
  const Token & expect(TokenKind k, std::string_view context);
  std::string_view expect_name(std::string_view what);
  std::string_view expect_member_name();

  [[noreturn]] void error_at(
    const Token & t, std::string message, std::string_view code, std::string hint = "") const;
  [[noreturn]] void error_at(
    SourceRange range, std::string message, std::string_view code, std::string hint = "") const;

  [[nodiscard]] SourceRange range_from(const Token & start) const;
  [[nodiscard]] SourceRange range_from(SourceRange start) const;

  template <typename T, typename... Args>
  T * make(Args &&... args)
  {
    return ast_.create<T>(std::forward<Args>(args)...);
  }

  template <typename T>
  gsl::span<T> to_span(const std::vector<T> & v)
  {
    return ast_.copy_to_arena(v);
  }

  std::string_view intern(std::string_view s) { return ast_.intern(s); }

  void skip_separators();

  // Statements
  /// Doc comments accumulate until the next declaration claims them.
  void collect_docs();
  std::vector<std::string_view> take_docs();
  Stmt * parse_statement(bool top_level);
  gsl::span<Stmt *> parse_block();
  Stmt * parse_function_decl(std::vector<std::string_view> docs, bool is_async);
  Stmt * parse_type_decl();
  Stmt * parse_interface_decl();
  Stmt * parse_import_decl();
  Stmt * parse_var_decl();
  Stmt * parse_let_destructure();
  Stmt * parse_if_stmt();
  Stmt * parse_for_stmt();
  Stmt * parse_while_stmt();
  Stmt * parse_try_stmt();
  Stmt * parse_return_stmt();
  Stmt * parse_guard_stmt();
  Stmt * parse_expression_stmt();
  gsl::span<Stmt *> parse_else_tail(std::vector<ElifClause *> & elifs, bool & has_else);

  // Region members
  Stmt * parse_region_body_stmt(BlockKind kind);
  Stmt * parse_region_member(BlockKind kind);
  NamedBlock * parse_named_block(BlockKind kind, bool name_required);
  Stmt * parse_state_decl();
  Stmt * parse_computed_decl();
  Stmt * parse_effect_decl();
  Stmt * parse_component_decl();
  Stmt * parse_store_decl();
  Stmt * parse_route_decl();
  Stmt * parse_middleware_decl();
  ConfigField * parse_config_field();
  std::vector<ConfigField *> parse_config_fields();
  [[nodiscard]] bool at_config_field() const;

  // Parameters and types
  std::vector<Param *> parse_params(TokenKind close);
  std::vector<std::string_view> parse_type_params();
  TypeNode * parse_type();

  // Expressions
  Expr * parse_expr();
  Expr * parse_pipe();
  Expr * parse_pipe_target();
  Expr * parse_coalesce();
  Expr * parse_or();
  Expr * parse_and();
  Expr * parse_not();
  Expr * parse_comparison();
  Expr * parse_range();
  Expr * parse_binary(int min_prec);
  Expr * parse_unary();
  Expr * parse_postfix(Expr * e);
  Expr * parse_primary();

  std::vector<Expr *> parse_call_args();
  Expr * parse_index_or_slice(Expr * object);
  Expr * parse_number(const Token & t);
  Expr * parse_template(const Token & t);
  Expr * parse_paren_expr();
  Expr * parse_array_element();
  Expr * parse_array_literal();
  Expr * parse_object_literal();
  Expr * parse_lambda(bool is_async);
  Expr * parse_arrow_lambda(std::vector<Param *> params, const Token & start, bool is_async);
  bool try_parse_arrow_params(std::vector<Param *> & out);
  Expr * parse_if_expr();
  Expr * parse_match_expr();
  MatchArm * parse_match_arm();

  // Patterns
  Pattern * parse_pattern();
  void check_pattern_bindings(const Pattern * p);

  // JSX
  Expr * parse_jsx_element();
  std::vector<AstNode *> parse_jsx_children(std::string_view tag);
  std::vector<AstNode *> parse_jsx_control_body();
  AstNode * parse_jsx_child();
  AstNode * parse_jsx_if();
  AstNode * parse_jsx_for();
  JsxAttribute * parse_jsx_attribute();

  AstContext & ast_;
  const SourceManager & sm_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
  std::vector<std::string_view> pending_docs_;
};

}  // namespace tova::syntax
