// tova/syntax/parser.cpp - Recursive-descent parser implementation
#include "tova/syntax/parser.hpp"

#include <cctype>
#include <cstdlib>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

#include "tova/basic/error_codes.hpp"
#include "tova/basic/errors.hpp"
#include "tova/syntax/block_registry.hpp"

namespace tova::syntax
{

namespace
{

struct BinaryInfo
{
  BinaryOp op;
  int prec;
  bool rightAssoc;
};

std::optional<BinaryInfo> binary_info(TokenKind k)
{
  switch (k) {
    case TokenKind::Plus:
      return BinaryInfo{BinaryOp::Add, 1, false};
    case TokenKind::Minus:
      return BinaryInfo{BinaryOp::Sub, 1, false};
    case TokenKind::Star:
      return BinaryInfo{BinaryOp::Mul, 2, false};
    case TokenKind::Slash:
      return BinaryInfo{BinaryOp::Div, 2, false};
    case TokenKind::Percent:
      return BinaryInfo{BinaryOp::Mod, 2, false};
    case TokenKind::StarStar:
      return BinaryInfo{BinaryOp::Pow, 3, true};
    default:
      return std::nullopt;
  }
}

std::optional<BinaryOp> comparison_op(TokenKind k)
{
  switch (k) {
    case TokenKind::EqEq:
      return BinaryOp::Eq;
    case TokenKind::BangEq:
      return BinaryOp::Ne;
    case TokenKind::Lt:
      return BinaryOp::Lt;
    case TokenKind::Le:
      return BinaryOp::Le;
    case TokenKind::Gt:
      return BinaryOp::Gt;
    case TokenKind::Ge:
      return BinaryOp::Ge;
    default:
      return std::nullopt;
  }
}

std::optional<AssignOp> compound_op(TokenKind k)
{
  switch (k) {
    case TokenKind::PlusEq:
      return AssignOp::AddAssign;
    case TokenKind::MinusEq:
      return AssignOp::SubAssign;
    case TokenKind::StarEq:
      return AssignOp::MulAssign;
    case TokenKind::SlashEq:
      return AssignOp::DivAssign;
    default:
      return std::nullopt;
  }
}

// Keywords that read as plain identifiers in expression position
// (`server.get_users()`, `state`, `type`).
bool is_soft_keyword(TokenKind k)
{
  switch (k) {
    case TokenKind::KwServer:
    case TokenKind::KwClient:
    case TokenKind::KwShared:
    case TokenKind::KwRoute:
    case TokenKind::KwState:
    case TokenKind::KwComputed:
    case TokenKind::KwEffect:
    case TokenKind::KwComponent:
    case TokenKind::KwStore:
    case TokenKind::KwDerive:
    case TokenKind::KwType:
    case TokenKind::KwFrom:
      return true;
    default:
      return false;
  }
}

bool is_name_token(const Token & t)
{
  return t.kind == TokenKind::Identifier || is_keyword(t.kind);
}

bool starts_operand(TokenKind k)
{
  return k == TokenKind::Identifier || k == TokenKind::KwFn || k == TokenKind::KwAsync ||
         k == TokenKind::KwAwait || k == TokenKind::LParen || is_soft_keyword(k);
}

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::Identifier:
      return "'" + std::string(t.text) + "'";
    default:
      return std::string(to_string(t.kind));
  }
}

bool is_assign_target(const Expr * e)
{
  return isa<Identifier>(e) || isa<MemberExpr>(e) || isa<IndexExpr>(e);
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return idx_ == 0 ? tokens_.front() : tokens_[idx_ - 1]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_ident(std::string_view text, size_t lookahead) const
{
  const Token & t = cur(lookahead);
  return t.kind == TokenKind::Identifier && t.text == text;
}

bool Parser::same_line_as_prev() const { return idx_ > 0 && cur().line == prev().line; }

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

const Token & Parser::expect(TokenKind k, std::string_view context)
{
  if (at(k)) {
    return advance();
  }
  const bool closing =
    k == TokenKind::RParen || k == TokenKind::RBrace || k == TokenKind::RBracket;
  std::string msg = "Expected " + std::string(to_string(k));
  if (!context.empty()) {
    msg += " " + std::string(context);
  }
  msg += ", found " + describe(cur());
  error_at(
    cur(), std::move(msg),
    closing ? error_codes::k_expected_closing : error_codes::k_unexpected_token);
}

std::string_view Parser::expect_name(std::string_view what)
{
  if (!at(TokenKind::Identifier)) {
    error_at(
      cur(), "Expected " + std::string(what) + ", found " + describe(cur()),
      error_codes::k_unexpected_token);
  }
  return intern(advance().text);
}

std::string_view Parser::expect_member_name()
{
  if (!is_name_token(cur())) {
    error_at(
      cur(), "Expected property name, found " + describe(cur()), error_codes::k_unexpected_token);
  }
  return intern(advance().text);
}

void Parser::error_at(
  const Token & t, std::string message, std::string_view code, std::string hint) const
{
  error_at(t.range, std::move(message), code, std::move(hint));
}

void Parser::error_at(
  SourceRange range, std::string message, std::string_view code, std::string hint) const
{
  std::optional<std::string> h;
  if (!hint.empty()) {
    h = std::move(hint);
  }
  throw ParseError(make_diagnostic(
    sm_, Severity::Error, range, std::move(message), std::string(code), std::move(h)));
}

SourceRange Parser::range_from(const Token & start) const { return range_from(start.range); }

SourceRange Parser::range_from(SourceRange start) const
{
  return {start.get_begin(), prev().range.get_end()};
}

void Parser::skip_separators()
{
  while (match(TokenKind::Semicolon)) {
  }
}

// ============================================================================
// Program and statements
// ============================================================================

Program * Parser::parse_program()
{
  const Token & first = cur();
  std::vector<Stmt *> body;
  while (true) {
    skip_separators();
    if (at_eof()) break;
    if (Stmt * s = parse_statement(true)) {
      body.push_back(s);
    } else if (at(TokenKind::RBrace)) {
      error_at(cur(), "Unexpected '}'", error_codes::k_unexpected_token);
    }
  }
  auto * program = make<Program>(SourceRange(first.range.get_begin(), cur().range.get_end()));
  program->body = to_span(body);
  return program;
}

Expr * Parser::parse_standalone_expr()
{
  Expr * e = parse_expr();
  if (!at_eof()) {
    error_at(
      cur(), "Unexpected " + describe(cur()) + " in interpolation",
      error_codes::k_unexpected_token);
  }
  return e;
}

void Parser::collect_docs()
{
  while (at(TokenKind::DocComment)) {
    pending_docs_.push_back(intern(advance().value));
  }
}

std::vector<std::string_view> Parser::take_docs() { return std::exchange(pending_docs_, {}); }

Stmt * Parser::parse_statement(bool top_level)
{
  collect_docs();
  std::vector<std::string_view> docs = take_docs();
  skip_separators();
  if (at(TokenKind::RBrace) || at_eof()) {
    return nullptr;
  }

  const Token & t = cur();
  if (const BlockEntry * entry = BlockRegistry::instance().find(t, cur(1), cur(2), top_level)) {
    return (this->*(entry->parse))();
  }

  switch (t.kind) {
    case TokenKind::KwFn:
      if (cur(1).kind == TokenKind::Identifier) {
        return parse_function_decl(std::move(docs), false);
      }
      break;
    case TokenKind::KwAsync:
      if (cur(1).kind == TokenKind::KwFn && cur(2).kind == TokenKind::Identifier) {
        advance();
        return parse_function_decl(std::move(docs), true);
      }
      break;
    case TokenKind::KwPub:
    case TokenKind::KwExport: {
      advance();
      const bool is_async = at(TokenKind::KwAsync);
      if (is_async) advance();
      if (at(TokenKind::KwFn)) {
        auto * fn = cast<FunctionDecl>(parse_function_decl(std::move(docs), is_async));
        fn->isPub = true;
        fn->range_ = range_from(t);
        return fn;
      }
      if (!is_async && at(TokenKind::KwType)) {
        Stmt * s = parse_type_decl();
        if (auto * td = dyn_cast<TypeDecl>(s)) td->isPub = true;
        s->range_ = range_from(t);
        return s;
      }
      error_at(
        cur(), "Expected function or type declaration after " + describe(t),
        error_codes::k_unexpected_token);
    }
    case TokenKind::KwType:
      return parse_type_decl();
    case TokenKind::KwInterface:
      return parse_interface_decl();
    case TokenKind::KwImport:
      return parse_import_decl();
    case TokenKind::KwVar:
      return parse_var_decl();
    case TokenKind::KwLet:
      return parse_let_destructure();
    case TokenKind::KwMut:
      error_at(
        t, "'mut' is not supported in Tova", error_codes::k_unexpected_token,
        "Use 'var' for mutable variables: var x = 0");
    case TokenKind::KwIf:
      return parse_if_stmt();
    case TokenKind::KwFor:
      return parse_for_stmt();
    case TokenKind::KwWhile:
      return parse_while_stmt();
    case TokenKind::KwTry:
      return parse_try_stmt();
    case TokenKind::KwReturn:
      return parse_return_stmt();
    case TokenKind::KwBreak:
      advance();
      return make<BreakStmt>(t.range);
    case TokenKind::KwContinue:
      advance();
      return make<ContinueStmt>(t.range);
    case TokenKind::KwGuard:
      return parse_guard_stmt();
    default:
      break;
  }
  return parse_expression_stmt();
}

gsl::span<Stmt *> Parser::parse_block()
{
  expect(TokenKind::LBrace, "to open block");
  std::vector<Stmt *> body;
  while (true) {
    skip_separators();
    if (at(TokenKind::RBrace) || at_eof()) break;
    if (Stmt * s = parse_statement(false)) {
      body.push_back(s);
    }
  }
  expect(TokenKind::RBrace, "to close block");
  return to_span(body);
}

Stmt * Parser::parse_function_decl(std::vector<std::string_view> docs, bool is_async)
{
  const Token & start = is_async ? prev() : cur();
  expect(TokenKind::KwFn, "");
  auto * fn = make<FunctionDecl>(expect_name("function name"));
  fn->typeParams = to_span(parse_type_params());
  expect(TokenKind::LParen, "after function name");
  fn->params = to_span(parse_params(TokenKind::RParen));
  if (match(TokenKind::Arrow)) {
    fn->returnType = parse_type();
  }
  fn->body = parse_block();
  fn->docs = to_span(docs);
  fn->isAsync = is_async;
  fn->range_ = range_from(start);
  return fn;
}

Stmt * Parser::parse_type_decl()
{
  const Token & start = advance();  // type
  const std::string_view name = expect_name("type name");
  const std::vector<std::string_view> type_params = parse_type_params();

  if (match(TokenKind::Eq)) {
    TypeNode * aliased = parse_type();
    auto * alias = make<TypeAliasDecl>(name, aliased, range_from(start));
    alias->typeParams = to_span(type_params);
    return alias;
  }

  expect(TokenKind::LBrace, "to open type body");
  std::vector<TypeVariant *> variants;
  std::vector<TypeField *> fields;
  while (true) {
    while (match(TokenKind::Comma) || match(TokenKind::Semicolon) ||
           match(TokenKind::DocComment)) {
    }
    if (at(TokenKind::RBrace) || at_eof()) break;

    const Token & entry = cur();
    const std::string_view entry_name = expect_name("variant or field name");
    if (match(TokenKind::LParen)) {
      std::vector<TypeField *> vfields;
      while (!at(TokenKind::RParen)) {
        const Token & fs = cur();
        const std::string_view fname = expect_name("field name");
        TypeNode * ftype = match(TokenKind::Colon) ? parse_type() : nullptr;
        vfields.push_back(make<TypeField>(fname, ftype, range_from(fs)));
        if (!match(TokenKind::Comma)) break;
      }
      expect(TokenKind::RParen, "to close variant fields");
      auto * variant = make<TypeVariant>(entry_name, range_from(entry));
      variant->fields = to_span(vfields);
      variants.push_back(variant);
    } else if (match(TokenKind::Colon)) {
      TypeNode * ftype = parse_type();
      fields.push_back(make<TypeField>(entry_name, ftype, range_from(entry)));
    } else {
      variants.push_back(make<TypeVariant>(entry_name, range_from(entry)));
    }
  }
  expect(TokenKind::RBrace, "to close type body");

  if (!variants.empty() && !fields.empty()) {
    error_at(
      range_from(start), "Type '" + std::string(name) + "' mixes variants and record fields",
      error_codes::k_unexpected_token, "Wrap the fields in a variant: Name(field: Type)");
  }

  std::vector<std::string_view> derives;
  if (match(TokenKind::KwDerive)) {
    expect(TokenKind::LBracket, "after 'derive'");
    while (!at(TokenKind::RBracket)) {
      derives.push_back(expect_name("trait name"));
      if (!match(TokenKind::Comma)) break;
    }
    expect(TokenKind::RBracket, "to close derive list");
  }

  auto * decl = make<TypeDecl>(name, range_from(start));
  decl->typeParams = to_span(type_params);
  decl->variants = to_span(variants);
  decl->fields = to_span(fields);
  decl->derives = to_span(derives);
  return decl;
}

Stmt * Parser::parse_interface_decl()
{
  const Token & start = advance();  // interface
  auto * decl = make<InterfaceDecl>(expect_name("interface name"));
  expect(TokenKind::LBrace, "to open interface body");
  std::vector<TypeField *> members;
  while (true) {
    while (match(TokenKind::Comma) || match(TokenKind::Semicolon) ||
           match(TokenKind::DocComment)) {
    }
    if (at(TokenKind::RBrace) || at_eof()) break;

    const Token & ms = cur();
    if (match(TokenKind::KwFn)) {
      const std::string_view mname = expect_name("method name");
      expect(TokenKind::LParen, "after method name");
      std::vector<TypeNode *> ptypes;
      for (const Param * p : parse_params(TokenKind::RParen)) {
        ptypes.push_back(p->type ? p->type : make<NamedType>(intern("Any"), p->get_range()));
      }
      auto * ftype = make<FunctionType>();
      ftype->params = to_span(ptypes);
      if (match(TokenKind::Arrow)) {
        ftype->returnType = parse_type();
      }
      ftype->range_ = range_from(ms);
      members.push_back(make<TypeField>(mname, ftype, range_from(ms)));
      continue;
    }
    const std::string_view mname = expect_name("member name");
    expect(TokenKind::Colon, "after member name");
    TypeNode * mtype = parse_type();
    members.push_back(make<TypeField>(mname, mtype, range_from(ms)));
  }
  expect(TokenKind::RBrace, "to close interface body");
  decl->members = to_span(members);
  decl->range_ = range_from(start);
  return decl;
}

Stmt * Parser::parse_import_decl()
{
  const Token & start = advance();  // import
  std::string_view default_name;
  std::vector<std::string_view> names;
  std::vector<std::string_view> aliases;

  if (match(TokenKind::LBrace)) {
    while (!at(TokenKind::RBrace)) {
      names.push_back(expect_name("imported name"));
      aliases.push_back(match(TokenKind::KwAs) ? expect_name("alias") : std::string_view{});
      if (!match(TokenKind::Comma)) break;
    }
    expect(TokenKind::RBrace, "to close import list");
  } else {
    default_name = expect_name("import name");
  }
  expect(TokenKind::KwFrom, "in import");
  const Token & source = expect(TokenKind::String, "module path");

  auto * decl = make<ImportDecl>(intern(source.value), range_from(start));
  decl->defaultName = default_name;
  decl->names = to_span(names);
  decl->aliases = to_span(aliases);
  return decl;
}

Stmt * Parser::parse_var_decl()
{
  const Token & start = advance();  // var
  std::vector<std::string_view> names;
  do {
    names.push_back(expect_name("variable name"));
  } while (match(TokenKind::Comma));

  auto * decl = make<VarDecl>();
  if (match(TokenKind::Colon)) {
    decl->type = parse_type();
  }
  std::vector<Expr *> values;
  if (match(TokenKind::Eq)) {
    do {
      values.push_back(parse_expr());
    } while (match(TokenKind::Comma));
    if (values.size() != names.size() && values.size() != 1) {
      error_at(
        range_from(start),
        "Expected " + std::to_string(names.size()) + " values, found " +
          std::to_string(values.size()),
        error_codes::k_unexpected_token);
    }
  }
  decl->names = to_span(names);
  decl->values = to_span(values);
  decl->range_ = range_from(start);
  return decl;
}

Stmt * Parser::parse_let_destructure()
{
  const Token & start = advance();  // let
  if (!at(TokenKind::LBrace) && !at(TokenKind::LBracket)) {
    error_at(
      start, "'let' is only used for destructuring in Tova", error_codes::k_unexpected_token,
      "Use 'var' for mutable variables, or 'x = value' for immutable bindings");
  }

  const bool is_object = at(TokenKind::LBrace);
  const TokenKind close = is_object ? TokenKind::RBrace : TokenKind::RBracket;
  advance();
  std::vector<std::string_view> keys;
  std::vector<std::string_view> names;
  while (!at(close)) {
    const std::string_view name = expect_name("binding name");
    if (is_object) {
      keys.push_back(name);
      names.push_back(match(TokenKind::Colon) ? expect_name("binding name") : name);
    } else {
      names.push_back(name);
    }
    if (!match(TokenKind::Comma)) break;
  }
  expect(close, "to close destructuring pattern");
  expect(TokenKind::Eq, "after destructuring pattern");

  auto * decl = make<LetDestructure>(is_object);
  decl->keys = to_span(keys);
  decl->names = to_span(names);
  decl->value = parse_expr();
  decl->range_ = range_from(start);
  return decl;
}

gsl::span<Stmt *> Parser::parse_else_tail(std::vector<ElifClause *> & elifs, bool & has_else)
{
  while (true) {
    const Token & t = cur();
    if (at(TokenKind::KwElif)) {
      advance();
    } else if (at(TokenKind::KwElse) && cur(1).kind == TokenKind::KwIf) {
      advance();
      advance();
    } else {
      break;
    }
    auto * clause = make<ElifClause>(parse_expr());
    clause->body = parse_block();
    clause->range_ = range_from(t);
    elifs.push_back(clause);
  }
  if (match(TokenKind::KwElse)) {
    has_else = true;
    return parse_block();
  }
  return {};
}

Stmt * Parser::parse_if_stmt()
{
  const Token & start = advance();  // if
  auto * stmt = make<IfStmt>(parse_expr());
  stmt->thenBody = parse_block();
  std::vector<ElifClause *> elifs;
  bool has_else = false;
  stmt->elseBody = parse_else_tail(elifs, has_else);
  stmt->elifs = to_span(elifs);
  stmt->hasElse = has_else;
  stmt->range_ = range_from(start);
  return stmt;
}

Stmt * Parser::parse_for_stmt()
{
  const Token & start = advance();  // for
  const std::string_view var = expect_name("loop variable");
  std::string_view second;
  if (match(TokenKind::Comma)) {
    second = expect_name("second loop variable");
  }
  expect(TokenKind::KwIn, "after loop variable");
  auto * stmt = make<ForStmt>(var, parse_expr());
  stmt->secondVar = second;
  stmt->body = parse_block();
  if (match(TokenKind::KwElse)) {
    stmt->hasElse = true;
    stmt->elseBody = parse_block();
  }
  stmt->range_ = range_from(start);
  return stmt;
}

Stmt * Parser::parse_while_stmt()
{
  const Token & start = advance();  // while
  auto * stmt = make<WhileStmt>(parse_expr());
  stmt->body = parse_block();
  stmt->range_ = range_from(start);
  return stmt;
}

Stmt * Parser::parse_try_stmt()
{
  const Token & start = advance();  // try
  auto * stmt = make<TryStmt>();
  stmt->body = parse_block();
  if (match(TokenKind::KwCatch)) {
    stmt->hasCatch = true;
    if (match(TokenKind::LParen)) {
      stmt->catchParam = expect_name("catch parameter");
      expect(TokenKind::RParen, "after catch parameter");
    } else if (at(TokenKind::Identifier)) {
      stmt->catchParam = expect_name("catch parameter");
    }
    stmt->catchBody = parse_block();
  }
  if (match(TokenKind::KwFinally)) {
    stmt->hasFinally = true;
    stmt->finallyBody = parse_block();
  }
  if (!stmt->hasCatch && !stmt->hasFinally) {
    error_at(
      cur(), "Expected 'catch' or 'finally' after try block", error_codes::k_unexpected_token);
  }
  stmt->range_ = range_from(start);
  return stmt;
}

Stmt * Parser::parse_return_stmt()
{
  const Token & start = advance();  // return
  Expr * value = nullptr;
  if (same_line_as_prev() && !at(TokenKind::RBrace) && !at(TokenKind::Semicolon) && !at_eof()) {
    value = parse_expr();
  }
  return make<ReturnStmt>(value, range_from(start));
}

Stmt * Parser::parse_guard_stmt()
{
  const Token & start = advance();  // guard
  auto * stmt = make<GuardStmt>(parse_expr());
  expect(TokenKind::KwElse, "after guard condition");
  stmt->elseBody = parse_block();
  stmt->range_ = range_from(start);
  return stmt;
}

Stmt * Parser::parse_expression_stmt()
{
  const Token & start = cur();
  Expr * first = parse_expr();

  auto check_target = [this](const Expr * target) {
    if (!is_assign_target(target)) {
      error_at(target->get_range(), "Invalid assignment target", error_codes::k_unexpected_token);
    }
  };

  if (at(TokenKind::Comma)) {
    std::vector<Expr *> targets{first};
    while (match(TokenKind::Comma)) {
      targets.push_back(parse_expr());
    }
    expect(TokenKind::Eq, "in multiple assignment");
    std::vector<Expr *> values;
    do {
      values.push_back(parse_expr());
    } while (match(TokenKind::Comma));
    for (const Expr * target : targets) {
      check_target(target);
    }
    auto * assign = make<Assignment>(range_from(start));
    assign->targets = to_span(targets);
    assign->values = to_span(values);
    return assign;
  }

  if (at(TokenKind::Colon) && isa<Identifier>(first)) {
    advance();
    TypeNode * type = parse_type();
    expect(TokenKind::Eq, "after type annotation");
    Expr * value = parse_expr();
    auto * assign = make<Assignment>(range_from(start));
    assign->targets = to_span(std::vector<Expr *>{first});
    assign->values = to_span(std::vector<Expr *>{value});
    assign->type = type;
    return assign;
  }

  if (match(TokenKind::Eq)) {
    check_target(first);
    Expr * value = parse_expr();
    auto * assign = make<Assignment>(range_from(start));
    assign->targets = to_span(std::vector<Expr *>{first});
    assign->values = to_span(std::vector<Expr *>{value});
    return assign;
  }

  if (const auto op = compound_op(cur().kind)) {
    advance();
    check_target(first);
    Expr * value = parse_expr();
    return make<CompoundAssign>(first, *op, value, range_from(start));
  }

  return make<ExprStmt>(first, range_from(start));
}

// ============================================================================
// Regions
// ============================================================================

NamedBlock * Parser::parse_named_block(BlockKind kind, bool name_required)
{
  const Token & start = advance();  // region keyword
  auto * block = make<NamedBlock>(kind);
  if (at(TokenKind::String)) {
    block->name = intern(advance().value);
  } else if (name_required) {
    error_at(
      cur(), "Expected block name string after " + describe(start),
      error_codes::k_unexpected_token);
  }
  expect(TokenKind::LBrace, "to open block");
  std::vector<Stmt *> body;
  while (true) {
    skip_separators();
    if (at(TokenKind::RBrace) || at_eof()) break;
    if (Stmt * s = parse_region_body_stmt(kind)) {
      body.push_back(s);
    }
  }
  pending_docs_.clear();
  expect(TokenKind::RBrace, "to close block");
  block->body = to_span(body);
  block->range_ = range_from(start);
  return block;
}

Stmt * Parser::parse_client_block() { return parse_named_block(BlockKind::Client, false); }

Stmt * Parser::parse_server_block() { return parse_named_block(BlockKind::Server, false); }

Stmt * Parser::parse_shared_block() { return parse_named_block(BlockKind::Shared, false); }

Stmt * Parser::parse_edge_block() { return parse_named_block(BlockKind::Edge, false); }

Stmt * Parser::parse_deploy_block() { return parse_named_block(BlockKind::Deploy, true); }

Stmt * Parser::parse_security_block() { return parse_named_block(BlockKind::Security, false); }

Stmt * Parser::parse_cli_block() { return parse_named_block(BlockKind::Cli, false); }

Stmt * Parser::parse_region_body_stmt(BlockKind kind)
{
  collect_docs();
  if (at(TokenKind::RBrace) || at_eof()) {
    return nullptr;
  }
  if (Stmt * member = parse_region_member(kind)) {
    pending_docs_.clear();
    return member;
  }
  return parse_statement(false);
}

Stmt * Parser::parse_region_member(BlockKind kind)
{
  switch (kind) {
    case BlockKind::Client:
      if (at(TokenKind::KwState)) return parse_state_decl();
      if (at(TokenKind::KwComputed)) return parse_computed_decl();
      if (at(TokenKind::KwEffect) && cur(1).kind == TokenKind::LBrace) return parse_effect_decl();
      if (at(TokenKind::KwComponent)) return parse_component_decl();
      if (at(TokenKind::KwStore)) return parse_store_decl();
      return nullptr;

    case BlockKind::Server:
      if (at(TokenKind::KwRoute)) return parse_route_decl();
      if (at_ident("middleware") && cur(1).kind == TokenKind::KwFn) return parse_middleware_decl();
      return nullptr;

    case BlockKind::Edge: {
      if (at(TokenKind::KwRoute)) return parse_route_decl();
      if (at_config_field()) return parse_config_field();
      static constexpr std::pair<std::string_view, EdgeBindingKind> k_bindings[] = {
        {"kv", EdgeBindingKind::Kv},         {"sql", EdgeBindingKind::Sql},
        {"storage", EdgeBindingKind::Storage}, {"queue", EdgeBindingKind::Queue},
        {"env", EdgeBindingKind::Env},       {"secret", EdgeBindingKind::Secret},
      };
      if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::Identifier) {
        for (const auto & [word, bkind] : k_bindings) {
          if (cur().text != word) continue;
          const Token & start = advance();
          auto * binding = make<EdgeBinding>(bkind, expect_name("binding name"));
          if (bkind == EdgeBindingKind::Env && match(TokenKind::Eq)) {
            binding->defaultValue = parse_expr();
          }
          binding->range_ = range_from(start);
          return binding;
        }
      }
      return nullptr;
    }

    case BlockKind::Deploy: {
      const Token & start = cur();
      if (at_ident("env") && cur(1).kind == TokenKind::LBrace) {
        advance();
        advance();
        auto * env = make<DeployEnvBlock>();
        env->entries = to_span(parse_config_fields());
        expect(TokenKind::RBrace, "to close env block");
        env->range_ = range_from(start);
        return env;
      }
      if (at_ident("db") && cur(1).kind == TokenKind::LBrace) {
        advance();
        advance();
        auto * db = make<DeployDbBlock>(expect_name("database engine"));
        expect(TokenKind::LBrace, "to open database settings");
        db->entries = to_span(parse_config_fields());
        expect(TokenKind::RBrace, "to close database settings");
        if (!at(TokenKind::RBrace)) {
          error_at(
            cur(), "Only one database engine is allowed per db block",
            error_codes::k_unexpected_token);
        }
        advance();
        db->range_ = range_from(start);
        return db;
      }
      if (at_config_field()) return parse_config_field();
      error_at(
        cur(), "Unexpected " + describe(cur()) + " in deploy block",
        error_codes::k_unexpected_token, "Deploy blocks contain 'key: value' fields, env and db");
    }

    case BlockKind::Security: {
      const Token & start = cur();
      if (at_ident("auth") && cur(1).kind == TokenKind::Identifier) {
        advance();
        auto * auth = make<SecurityAuth>(expect_name("auth kind"));
        expect(TokenKind::LBrace, "to open auth settings");
        auth->entries = to_span(parse_config_fields());
        expect(TokenKind::RBrace, "to close auth settings");
        auth->range_ = range_from(start);
        return auth;
      }
      if (at_ident("role") && cur(1).kind == TokenKind::Identifier) {
        advance();
        auto * role = make<SecurityRole>(expect_name("role name"));
        expect(TokenKind::LBrace, "to open role body");
        std::vector<std::string_view> permissions;
        for (const ConfigField * field : parse_config_fields()) {
          const auto * list = dyn_cast<ArrayLiteral>(field->value);
          if (field->key != "can" || list == nullptr) {
            error_at(
              field->get_range(), "Role fields must be 'can: [permission, ...]'",
              error_codes::k_unexpected_token);
          }
          for (const Expr * p : list->elements) {
            if (const auto * id = dyn_cast<Identifier>(p)) {
              permissions.push_back(id->name);
            } else if (const auto * s = dyn_cast<StringLiteral>(p)) {
              permissions.push_back(s->value);
            } else {
              error_at(
                p->get_range(), "Permission must be a name or string",
                error_codes::k_unexpected_token);
            }
          }
        }
        expect(TokenKind::RBrace, "to close role body");
        role->permissions = to_span(permissions);
        role->range_ = range_from(start);
        return role;
      }
      if (at_ident("protect") && cur(1).kind == TokenKind::String) {
        advance();
        auto * protect = make<SecurityProtect>(intern(advance().value));
        expect(TokenKind::LBrace, "to open protect body");
        std::vector<ConfigField *> rest;
        for (ConfigField * field : parse_config_fields()) {
          if (field->key != "require") {
            rest.push_back(field);
          } else if (const auto * id = dyn_cast<Identifier>(field->value)) {
            protect->require = id->name;
          } else if (const auto * s = dyn_cast<StringLiteral>(field->value)) {
            protect->require = s->value;
          } else {
            error_at(
              field->get_range(), "'require' must name a role", error_codes::k_unexpected_token);
          }
        }
        expect(TokenKind::RBrace, "to close protect body");
        protect->entries = to_span(rest);
        protect->range_ = range_from(start);
        return protect;
      }
      error_at(
        cur(), "Unexpected " + describe(cur()) + " in security block",
        error_codes::k_unexpected_token, "Security blocks contain auth, role and protect entries");
    }

    case BlockKind::Cli:
      if (at_config_field()) return parse_config_field();
      return nullptr;

    case BlockKind::Shared:
      return nullptr;
  }
  return nullptr;
}

bool Parser::at_config_field() const
{
  return (is_name_token(cur()) || at(TokenKind::String)) && cur(1).kind == TokenKind::Colon;
}

ConfigField * Parser::parse_config_field()
{
  const Token & start = cur();
  const std::string_view key =
    at(TokenKind::String) ? intern(advance().value) : expect_member_name();
  expect(TokenKind::Colon, "after field name");
  Expr * value = parse_expr();
  auto * field = make<ConfigField>(key, value, range_from(start));
  match(TokenKind::Comma);
  return field;
}

std::vector<ConfigField *> Parser::parse_config_fields()
{
  std::vector<ConfigField *> fields;
  while (true) {
    skip_separators();
    if (at(TokenKind::RBrace) || at_eof()) break;
    if (!at_config_field()) {
      error_at(
        cur(), "Expected 'key: value' field, found " + describe(cur()),
        error_codes::k_unexpected_token);
    }
    fields.push_back(parse_config_field());
  }
  return fields;
}

Stmt * Parser::parse_state_decl()
{
  const Token & start = advance();  // state
  const std::string_view name = expect_name("state name");
  TypeNode * type = match(TokenKind::Colon) ? parse_type() : nullptr;
  expect(TokenKind::Eq, "after state name");
  auto * decl = make<StateDecl>(name, parse_expr());
  decl->type = type;
  decl->range_ = range_from(start);
  return decl;
}

Stmt * Parser::parse_computed_decl()
{
  const Token & start = advance();  // computed
  const std::string_view name = expect_name("computed name");
  expect(TokenKind::Eq, "after computed name");
  Expr * value = parse_expr();
  return make<ComputedDecl>(name, value, range_from(start));
}

Stmt * Parser::parse_effect_decl()
{
  const Token & start = advance();  // effect
  auto * decl = make<EffectDecl>();
  decl->body = parse_block();
  decl->range_ = range_from(start);
  return decl;
}

Stmt * Parser::parse_component_decl()
{
  const Token & start = advance();  // component
  auto * decl = make<ComponentDecl>(expect_name("component name"));
  if (match(TokenKind::LParen)) {
    decl->params = to_span(parse_params(TokenKind::RParen));
  }
  expect(TokenKind::LBrace, "to open component body");
  std::vector<Stmt *> body;
  while (true) {
    skip_separators();
    if (at(TokenKind::StyleBlock)) {
      decl->style = intern(advance().value);
      continue;
    }
    if (at(TokenKind::RBrace) || at_eof()) break;
    if (Stmt * s = parse_region_body_stmt(BlockKind::Client)) {
      body.push_back(s);
    }
  }
  pending_docs_.clear();
  expect(TokenKind::RBrace, "to close component body");
  decl->body = to_span(body);
  decl->range_ = range_from(start);
  return decl;
}

Stmt * Parser::parse_store_decl()
{
  const Token & start = advance();  // store
  auto * decl = make<StoreDecl>(expect_name("store name"));
  expect(TokenKind::LBrace, "to open store body");
  std::vector<Stmt *> body;
  while (true) {
    skip_separators();
    if (at(TokenKind::RBrace) || at_eof()) break;
    if (Stmt * s = parse_region_body_stmt(BlockKind::Client)) {
      body.push_back(s);
    }
  }
  pending_docs_.clear();
  expect(TokenKind::RBrace, "to close store body");
  decl->body = to_span(body);
  decl->range_ = range_from(start);
  return decl;
}

Stmt * Parser::parse_route_decl()
{
  const Token & start = advance();  // route
  if (!at(TokenKind::Identifier)) {
    error_at(
      cur(), "Expected HTTP method after 'route', found " + describe(cur()),
      error_codes::k_unexpected_token, "Write routes as: route GET \"/path\" => handler");
  }
  const std::string_view method = intern(advance().text);
  const Token & path = expect(TokenKind::String, "route path");
  expect(TokenKind::FatArrow, "after route path");
  Expr * handler = parse_expr();
  return make<RouteDecl>(method, intern(path.value), handler, range_from(start));
}

Stmt * Parser::parse_middleware_decl()
{
  const Token & start = advance();  // middleware
  auto * fn = cast<FunctionDecl>(parse_function_decl({}, false));
  return make<MiddlewareDecl>(fn, range_from(start));
}

Stmt * Parser::parse_concurrent_block()
{
  const Token & start = advance();  // concurrent
  ConcurrentMode mode = ConcurrentMode::All;
  if (at_ident("all")) {
    advance();
  } else if (at_ident("cancel_on_error")) {
    advance();
    mode = ConcurrentMode::CancelOnError;
  } else if (at_ident("first")) {
    advance();
    mode = ConcurrentMode::First;
  }

  auto * block = make<ConcurrentBlock>(mode);
  if (at_ident("timeout") && cur(1).kind == TokenKind::LParen) {
    advance();
    advance();
    block->timeout = parse_expr();
    expect(TokenKind::RParen, "after timeout");
  }
  block->body = parse_block();
  block->range_ = range_from(start);
  return block;
}

Stmt * Parser::parse_select_stmt()
{
  const Token & start = advance();  // select
  expect(TokenKind::LBrace, "to open select body");
  std::vector<SelectCase *> cases;
  while (true) {
    while (match(TokenKind::Comma) || match(TokenKind::Semicolon)) {
    }
    if (at(TokenKind::RBrace) || at_eof()) break;

    const Token & cs = cur();
    SelectCase * c = nullptr;
    if (at_ident("_") && cur(1).kind == TokenKind::FatArrow) {
      advance();
      c = make<SelectCase>(SelectCaseKind::Default);
    } else if (at_ident("timeout") && cur(1).kind == TokenKind::LParen) {
      advance();
      advance();
      c = make<SelectCase>(SelectCaseKind::Timeout);
      c->value = parse_expr();
      expect(TokenKind::RParen, "after timeout");
    } else if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::KwFrom) {
      c = make<SelectCase>(SelectCaseKind::Receive);
      c->binding = intern(advance().text);
      advance();
      c->channel = parse_expr();
    } else {
      Expr * e = parse_expr();
      const auto * call = dyn_cast<CallExpr>(e);
      const auto * callee = call ? dyn_cast<MemberExpr>(call->callee) : nullptr;
      if (callee == nullptr || callee->property != "send" || call->args.size() != 1) {
        error_at(
          e->get_range(), "Expected select case", error_codes::k_unexpected_token,
          "Cases are 'name from ch', 'ch.send(v)', 'timeout(ms)' or '_'");
      }
      c = make<SelectCase>(SelectCaseKind::Send);
      c->channel = callee->object;
      c->value = call->args[0];
    }

    expect(TokenKind::FatArrow, "after select case");
    if (at(TokenKind::LBrace)) {
      c->body = parse_block();
    } else {
      const Token & bs = cur();
      Expr * e = parse_expr();
      c->body = to_span(std::vector<Stmt *>{make<ExprStmt>(e, range_from(bs))});
    }
    c->range_ = range_from(cs);
    cases.push_back(c);
  }
  expect(TokenKind::RBrace, "to close select body");
  auto * stmt = make<SelectStmt>(range_from(start));
  stmt->cases = to_span(cases);
  return stmt;
}

// ============================================================================
// Parameters and types
// ============================================================================

std::vector<Param *> Parser::parse_params(TokenKind close)
{
  std::vector<Param *> params;
  while (!at(close)) {
    const Token & start = cur();
    auto * p = make<Param>(expect_name("parameter name"));
    if (match(TokenKind::Colon)) {
      p->type = parse_type();
    }
    if (match(TokenKind::Eq)) {
      p->defaultValue = parse_expr();
    }
    p->range_ = range_from(start);
    params.push_back(p);
    if (!match(TokenKind::Comma)) break;
  }
  expect(close, "to close parameter list");
  return params;
}

std::vector<std::string_view> Parser::parse_type_params()
{
  std::vector<std::string_view> names;
  if (!match(TokenKind::Lt)) {
    return names;
  }
  while (!at(TokenKind::Gt)) {
    names.push_back(expect_name("type parameter"));
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::Gt, "to close type parameters");
  return names;
}

TypeNode * Parser::parse_type()
{
  const Token & start = cur();
  if (match(TokenKind::LBracket)) {
    TypeNode * elem = parse_type();
    expect(TokenKind::RBracket, "to close array type");
    return make<ArrayType>(elem, range_from(start));
  }
  if (match(TokenKind::LParen)) {
    std::vector<TypeNode *> elems;
    while (!at(TokenKind::RParen)) {
      elems.push_back(parse_type());
      if (!match(TokenKind::Comma)) break;
    }
    expect(TokenKind::RParen, "to close tuple type");
    auto * t = make<TupleType>(range_from(start));
    t->elements = to_span(elems);
    return t;
  }
  if (match(TokenKind::KwFn)) {
    expect(TokenKind::LParen, "in function type");
    std::vector<TypeNode *> params;
    while (!at(TokenKind::RParen)) {
      params.push_back(parse_type());
      if (!match(TokenKind::Comma)) break;
    }
    expect(TokenKind::RParen, "to close function type parameters");
    auto * t = make<FunctionType>();
    t->params = to_span(params);
    if (match(TokenKind::Arrow)) {
      t->returnType = parse_type();
    }
    t->range_ = range_from(start);
    return t;
  }
  if (match(TokenKind::KwNil)) {
    return make<NamedType>(intern("Nil"), start.range);
  }

  auto * t = make<NamedType>(expect_name("type name"));
  if (match(TokenKind::Lt)) {
    std::vector<TypeNode *> args;
    while (!at(TokenKind::Gt)) {
      args.push_back(parse_type());
      if (!match(TokenKind::Comma)) break;
    }
    expect(TokenKind::Gt, "to close type arguments");
    t->typeArgs = to_span(args);
  }
  t->range_ = range_from(start);
  return t;
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_expr() { return parse_pipe(); }

Expr * Parser::parse_pipe()
{
  const Token & start = cur();
  Expr * lhs = parse_coalesce();
  while (match(TokenKind::PipeGt)) {
    Expr * rhs = parse_pipe_target();
    lhs = make<PipeExpr>(lhs, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_pipe_target()
{
  // `x |> .method(a)` pipes into a method of the left-hand value; the
  // receiver is written as the `_` placeholder.
  if (at(TokenKind::Dot)) {
    const Token & dot = advance();
    auto * placeholder = make<Identifier>(intern("_"), dot.range);
    const std::string_view name = expect_member_name();
    return parse_postfix(make<MemberExpr>(placeholder, name, false, range_from(dot)));
  }
  return parse_coalesce();
}

Expr * Parser::parse_coalesce()
{
  const Token & start = cur();
  Expr * lhs = parse_or();
  while (match(TokenKind::QuestionQuestion)) {
    Expr * rhs = parse_or();
    lhs = make<BinaryExpr>(lhs, BinaryOp::Coalesce, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_or()
{
  const Token & start = cur();
  Expr * lhs = parse_and();
  while (at(TokenKind::KwOr) || at(TokenKind::OrOr)) {
    advance();
    Expr * rhs = parse_and();
    lhs = make<BinaryExpr>(lhs, BinaryOp::Or, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  const Token & start = cur();
  Expr * lhs = parse_not();
  while (at(TokenKind::KwAnd) || at(TokenKind::AndAnd)) {
    advance();
    Expr * rhs = parse_not();
    lhs = make<BinaryExpr>(lhs, BinaryOp::And, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_not()
{
  const Token & start = cur();
  if (match(TokenKind::KwNot)) {
    Expr * operand = parse_not();
    return make<UnaryExpr>(UnaryOp::Not, operand, range_from(start));
  }
  return parse_comparison();
}

Expr * Parser::parse_comparison()
{
  const Token & start = cur();
  Expr * first = parse_range();

  if (at(TokenKind::KwIn) || (at(TokenKind::KwNot) && cur(1).kind == TokenKind::KwIn)) {
    const bool negated = at(TokenKind::KwNot);
    if (negated) advance();
    advance();
    Expr * collection = parse_range();
    return make<MembershipExpr>(first, collection, negated, range_from(start));
  }

  std::vector<Expr *> operands{first};
  std::vector<BinaryOp> ops;
  while (const auto op = comparison_op(cur().kind)) {
    advance();
    ops.push_back(*op);
    operands.push_back(parse_range());
  }
  if (ops.empty()) {
    return first;
  }
  if (ops.size() == 1) {
    return make<BinaryExpr>(operands[0], ops[0], operands[1], range_from(start));
  }
  auto * chain = make<ChainedComparison>(range_from(start));
  chain->operands = to_span(operands);
  chain->ops = to_span(ops);
  return chain;
}

Expr * Parser::parse_range()
{
  const Token & start = cur();
  Expr * lhs = parse_binary(1);
  if (at(TokenKind::DotDot) || at(TokenKind::DotDotEq)) {
    const bool inclusive = advance().kind == TokenKind::DotDotEq;
    Expr * rhs = parse_binary(1);
    return make<RangeExpr>(lhs, rhs, inclusive, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_binary(int min_prec)
{
  const Token & start = cur();
  Expr * lhs = parse_unary();
  while (true) {
    const auto info = binary_info(cur().kind);
    if (!info || info->prec < min_prec) break;
    advance();
    Expr * rhs = parse_binary(info->rightAssoc ? info->prec : info->prec + 1);
    lhs = make<BinaryExpr>(lhs, info->op, rhs, range_from(start));
  }
  return lhs;
}

Expr * Parser::parse_unary()
{
  const Token & start = cur();
  if (match(TokenKind::Minus)) {
    Expr * operand = parse_unary();
    return make<UnaryExpr>(UnaryOp::Neg, operand, range_from(start));
  }
  if (match(TokenKind::Bang)) {
    Expr * operand = parse_unary();
    return make<UnaryExpr>(UnaryOp::Not, operand, range_from(start));
  }
  if (match(TokenKind::KwAwait)) {
    Expr * operand = parse_unary();
    return make<AwaitExpr>(operand, range_from(start));
  }
  if (at_ident("spawn") && cur(1).line == start.line && starts_operand(cur(1).kind)) {
    advance();
    Expr * operand = parse_unary();
    return make<SpawnExpr>(operand, range_from(start));
  }
  return parse_postfix(parse_primary());
}

Expr * Parser::parse_postfix(Expr * e)
{
  const SourceRange start = e->get_range();
  while (true) {
    if (at(TokenKind::LParen) && same_line_as_prev()) {
      advance();
      auto * call = make<CallExpr>(e);
      call->args = to_span(parse_call_args());
      call->range_ = range_from(start);
      e = call;
      continue;
    }
    if (match(TokenKind::Dot)) {
      if (at(TokenKind::Number)) {
        // Tuple element access: `pair.0`
        const Token & idx = advance();
        e = make<IndexExpr>(e, parse_number(idx), range_from(start));
        continue;
      }
      const std::string_view name = expect_member_name();
      e = make<MemberExpr>(e, name, false, range_from(start));
      continue;
    }
    if (match(TokenKind::QuestionDot)) {
      const std::string_view name = expect_member_name();
      e = make<MemberExpr>(e, name, true, range_from(start));
      continue;
    }
    if (at(TokenKind::LBracket) && same_line_as_prev()) {
      e = parse_index_or_slice(e);
      continue;
    }
    if (at(TokenKind::Question) && same_line_as_prev()) {
      advance();
      e = make<PropagateExpr>(e, range_from(start));
      continue;
    }
    break;
  }
  return e;
}

std::vector<Expr *> Parser::parse_call_args()
{
  std::vector<Expr *> args;
  while (!at(TokenKind::RParen)) {
    const Token & start = cur();
    if (match(TokenKind::Ellipsis)) {
      Expr * operand = parse_expr();
      args.push_back(make<SpreadExpr>(operand, range_from(start)));
    } else if (is_name_token(cur()) && cur(1).kind == TokenKind::Colon) {
      const std::string_view name = intern(advance().text);
      advance();
      Expr * value = parse_expr();
      args.push_back(make<NamedArgument>(name, value, range_from(start)));
    } else {
      args.push_back(parse_expr());
    }
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::RParen, "to close argument list");
  return args;
}

Expr * Parser::parse_index_or_slice(Expr * object)
{
  const SourceRange start = object->get_range();
  advance();  // [
  Expr * first = nullptr;
  if (!at(TokenKind::Colon)) {
    first = parse_expr();
  }
  if (match(TokenKind::Colon)) {
    auto * slice = make<SliceExpr>(object);
    slice->start = first;
    if (!at(TokenKind::Colon) && !at(TokenKind::RBracket)) {
      slice->end = parse_expr();
    }
    if (match(TokenKind::Colon) && !at(TokenKind::RBracket)) {
      slice->step = parse_expr();
    }
    expect(TokenKind::RBracket, "to close slice");
    slice->range_ = range_from(start);
    return slice;
  }
  expect(TokenKind::RBracket, "to close index");
  return make<IndexExpr>(object, first, range_from(start));
}

Expr * Parser::parse_primary()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::Number:
      advance();
      return parse_number(t);
    case TokenKind::String:
      advance();
      return make<StringLiteral>(intern(t.value), t.range);
    case TokenKind::Template:
      advance();
      return parse_template(t);
    case TokenKind::KwTrue:
    case TokenKind::KwFalse:
      advance();
      return make<BoolLiteral>(t.kind == TokenKind::KwTrue, t.range);
    case TokenKind::KwNil:
      advance();
      return make<NilLiteral>(t.range);
    case TokenKind::Identifier:
      if (cur(1).kind == TokenKind::FatArrow) {
        advance();
        std::vector<Param *> params{make<Param>(intern(t.text), t.range)};
        return parse_arrow_lambda(std::move(params), t, false);
      }
      advance();
      return make<Identifier>(intern(t.text), t.range);
    case TokenKind::KwFn:
      return parse_lambda(false);
    case TokenKind::KwAsync:
      if (cur(1).kind == TokenKind::KwFn) {
        advance();
        return parse_lambda(true);
      }
      break;
    case TokenKind::LParen:
      return parse_paren_expr();
    case TokenKind::LBracket:
      return parse_array_literal();
    case TokenKind::LBrace:
      return parse_object_literal();
    case TokenKind::KwMatch:
      return parse_match_expr();
    case TokenKind::KwIf:
      return parse_if_expr();
    case TokenKind::JsxTagOpen:
      return parse_jsx_element();
    default:
      if (is_soft_keyword(t.kind)) {
        advance();
        return make<Identifier>(intern(t.text), t.range);
      }
      break;
  }
  error_at(t, "Expected expression, found " + describe(t), error_codes::k_expected_expression);
}

Expr * Parser::parse_number(const Token & t)
{
  const std::string & digits = t.value;
  double value = 0;
  bool is_float = false;
  if (
    digits.size() > 2 && digits[0] == '0' &&
    std::isalpha(static_cast<unsigned char>(digits[1]))) {
    int base = 10;
    switch (std::tolower(static_cast<unsigned char>(digits[1]))) {
      case 'x':
        base = 16;
        break;
      case 'o':
        base = 8;
        break;
      case 'b':
        base = 2;
        break;
      default:
        error_at(t, "Invalid number literal '" + digits + "'", error_codes::k_invalid_number);
    }
    value = static_cast<double>(std::strtoull(digits.c_str() + 2, nullptr, base));
  } else {
    is_float = digits.find_first_of(".eE") != std::string::npos;
    value = std::strtod(digits.c_str(), nullptr);
  }
  return make<NumberLiteral>(value, intern(digits), is_float, t.range);
}

Expr * Parser::parse_template(const Token & t)
{
  std::vector<Expr *> parts;
  for (const TemplatePart & part : t.parts) {
    if (!part.is_expr) {
      parts.push_back(make<StringLiteral>(intern(part.text), part.range));
      continue;
    }
    Parser sub(ast_, sm_, part.tokens);
    parts.push_back(sub.parse_standalone_expr());
  }
  auto * tpl = make<TemplateLiteral>(t.range);
  tpl->parts = to_span(parts);
  return tpl;
}

bool Parser::try_parse_arrow_params(std::vector<Param *> & out)
{
  if (!match(TokenKind::LParen)) return false;
  while (!at(TokenKind::RParen)) {
    if (!at(TokenKind::Identifier)) return false;
    const Token & name = advance();
    auto * p = make<Param>(intern(name.text));
    if (at(TokenKind::Colon)) {
      // Typed parameters only appear in lambdas, so the annotation commits.
      advance();
      p->type = parse_type();
    }
    if (match(TokenKind::Eq)) {
      p->defaultValue = parse_expr();
    }
    p->range_ = range_from(name);
    out.push_back(p);
    if (!match(TokenKind::Comma)) break;
  }
  if (!match(TokenKind::RParen)) return false;
  return at(TokenKind::FatArrow);
}

Expr * Parser::parse_paren_expr()
{
  const Token & start = cur();
  {
    std::vector<Param *> params;
    const size_t saved = idx_;
    if (try_parse_arrow_params(params)) {
      return parse_arrow_lambda(std::move(params), start, false);
    }
    idx_ = saved;
  }

  advance();  // (
  if (match(TokenKind::RParen)) {
    return make<TupleExpr>(range_from(start));
  }
  Expr * first = parse_expr();
  if (at(TokenKind::Comma)) {
    std::vector<Expr *> elements{first};
    while (match(TokenKind::Comma)) {
      if (at(TokenKind::RParen)) break;
      elements.push_back(parse_expr());
    }
    expect(TokenKind::RParen, "to close tuple");
    auto * tuple = make<TupleExpr>(range_from(start));
    tuple->elements = to_span(elements);
    return tuple;
  }
  expect(TokenKind::RParen, "to close parenthesized expression");
  return first;
}

Expr * Parser::parse_arrow_lambda(std::vector<Param *> params, const Token & start, bool is_async)
{
  expect(TokenKind::FatArrow, "in lambda");
  auto * lambda = make<LambdaExpr>();
  lambda->params = to_span(params);
  lambda->isAsync = is_async;
  if (at(TokenKind::LBrace)) {
    lambda->isBlock = true;
    lambda->body = parse_block();
  } else {
    lambda->bodyExpr = parse_expr();
  }
  lambda->range_ = range_from(start);
  return lambda;
}

Expr * Parser::parse_lambda(bool is_async)
{
  const Token & start = is_async ? prev() : cur();
  expect(TokenKind::KwFn, "");
  expect(TokenKind::LParen, "after 'fn'");
  auto * lambda = make<LambdaExpr>();
  lambda->params = to_span(parse_params(TokenKind::RParen));
  lambda->isAsync = is_async;
  if (match(TokenKind::Arrow)) {
    // Lambda return annotations are accepted but not checked.
    (void)parse_type();
  }
  if (at(TokenKind::LBrace)) {
    lambda->isBlock = true;
    lambda->body = parse_block();
  } else {
    lambda->bodyExpr = parse_expr();
  }
  lambda->range_ = range_from(start);
  return lambda;
}

Expr * Parser::parse_array_element()
{
  const Token & start = cur();
  if (match(TokenKind::Ellipsis)) {
    Expr * operand = parse_expr();
    return make<SpreadExpr>(operand, range_from(start));
  }
  return parse_expr();
}

Expr * Parser::parse_array_literal()
{
  const Token & start = advance();  // [
  if (match(TokenKind::RBracket)) {
    return make<ArrayLiteral>(range_from(start));
  }

  Expr * first = parse_array_element();
  if (match(TokenKind::KwFor)) {
    const std::string_view var = expect_name("loop variable");
    auto * comp = make<ListComprehension>(first, var);
    if (match(TokenKind::Comma)) {
      comp->secondVar = expect_name("second loop variable");
    }
    expect(TokenKind::KwIn, "in comprehension");
    comp->iterable = parse_expr();
    if (match(TokenKind::KwIf)) {
      comp->condition = parse_expr();
    }
    expect(TokenKind::RBracket, "to close list comprehension");
    comp->range_ = range_from(start);
    return comp;
  }

  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (at(TokenKind::RBracket)) break;
    elements.push_back(parse_array_element());
  }
  expect(TokenKind::RBracket, "to close array literal");
  auto * array = make<ArrayLiteral>(range_from(start));
  array->elements = to_span(elements);
  return array;
}

Expr * Parser::parse_object_literal()
{
  const Token & start = advance();  // {
  std::vector<ObjectProperty *> props;
  while (true) {
    while (match(TokenKind::Comma)) {
    }
    if (at(TokenKind::RBrace) || at_eof()) break;

    const Token & ps = cur();
    if (match(TokenKind::Ellipsis)) {
      Expr * operand = parse_expr();
      auto * spread = make<SpreadExpr>(operand, range_from(ps));
      props.push_back(make<ObjectProperty>(std::string_view{}, spread, range_from(ps)));
      continue;
    }

    std::string_view key;
    Expr * key_expr = nullptr;
    if (at(TokenKind::String)) {
      key = intern(advance().value);
      key_expr = make<StringLiteral>(key, ps.range);
    } else if (is_name_token(cur())) {
      key = intern(advance().text);
      key_expr = make<Identifier>(key, ps.range);
    } else {
      error_at(
        cur(), "Expected property name, found " + describe(cur()),
        error_codes::k_unexpected_token);
    }

    if (!match(TokenKind::Colon)) {
      auto * prop = make<ObjectProperty>(key, make<Identifier>(key, ps.range), ps.range);
      prop->shorthand = true;
      props.push_back(prop);
      continue;
    }

    Expr * value = parse_expr();
    if (props.empty() && match(TokenKind::KwFor)) {
      const std::string_view var = expect_name("loop variable");
      auto * comp = make<DictComprehension>(key_expr, value, var);
      if (match(TokenKind::Comma)) {
        comp->secondVar = expect_name("second loop variable");
      }
      expect(TokenKind::KwIn, "in comprehension");
      comp->iterable = parse_expr();
      if (match(TokenKind::KwIf)) {
        comp->condition = parse_expr();
      }
      expect(TokenKind::RBrace, "to close dict comprehension");
      comp->range_ = range_from(start);
      return comp;
    }
    props.push_back(make<ObjectProperty>(key, value, range_from(ps)));
  }
  expect(TokenKind::RBrace, "to close object literal");
  auto * object = make<ObjectLiteral>(range_from(start));
  object->properties = to_span(props);
  return object;
}

Expr * Parser::parse_if_expr()
{
  const Token & start = advance();  // if
  auto * e = make<IfExpr>(parse_expr());
  e->thenBody = parse_block();
  std::vector<ElifClause *> elifs;
  bool has_else = false;
  e->elseBody = parse_else_tail(elifs, has_else);
  e->elifs = to_span(elifs);
  e->range_ = range_from(start);
  return e;
}

Expr * Parser::parse_match_expr()
{
  const Token & start = advance();  // match
  auto * e = make<MatchExpr>(parse_expr());
  expect(TokenKind::LBrace, "to open match body");
  std::vector<MatchArm *> arms;
  while (true) {
    while (match(TokenKind::Comma) || match(TokenKind::Semicolon)) {
    }
    if (at(TokenKind::RBrace) || at_eof()) break;
    arms.push_back(parse_match_arm());
  }
  expect(TokenKind::RBrace, "to close match body");
  e->arms = to_span(arms);
  e->range_ = range_from(start);
  return e;
}

MatchArm * Parser::parse_match_arm()
{
  const Token & start = cur();
  Pattern * pattern = parse_pattern();
  check_pattern_bindings(pattern);
  auto * arm = make<MatchArm>(pattern);
  if (match(TokenKind::KwIf)) {
    arm->guard = parse_expr();
  }
  expect(TokenKind::FatArrow, "after match pattern");
  if (at(TokenKind::LBrace)) {
    arm->isBlock = true;
    arm->body = parse_block();
  } else {
    arm->bodyExpr = parse_expr();
  }
  arm->range_ = range_from(start);
  return arm;
}

// ============================================================================
// Patterns
// ============================================================================

Pattern * Parser::parse_pattern()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::Identifier: {
      advance();
      if (t.text == "_") {
        return make<WildcardPattern>(t.range);
      }
      const std::string_view name = intern(t.text);
      if (!std::isupper(static_cast<unsigned char>(name.front()))) {
        return make<BindingPattern>(name, t.range);
      }
      auto * variant = make<VariantPattern>(name);
      if (match(TokenKind::LParen)) {
        std::vector<Pattern *> fields;
        while (!at(TokenKind::RParen)) {
          fields.push_back(parse_pattern());
          if (!match(TokenKind::Comma)) break;
        }
        expect(TokenKind::RParen, "to close variant pattern");
        variant->fields = to_span(fields);
      }
      variant->range_ = range_from(t);
      return variant;
    }

    case TokenKind::LBracket:
    case TokenKind::LParen: {
      const bool is_array = t.kind == TokenKind::LBracket;
      const TokenKind close = is_array ? TokenKind::RBracket : TokenKind::RParen;
      advance();
      std::vector<Pattern *> elements;
      while (!at(close)) {
        elements.push_back(parse_pattern());
        if (!match(TokenKind::Comma)) break;
      }
      expect(close, is_array ? "to close array pattern" : "to close tuple pattern");
      if (is_array) {
        auto * p = make<ArrayPattern>(range_from(t));
        p->elements = to_span(elements);
        return p;
      }
      auto * p = make<TuplePattern>(range_from(t));
      p->elements = to_span(elements);
      return p;
    }

    default:
      break;
  }

  auto literal = [this]() -> Expr * {
    const Token & lt = cur();
    switch (lt.kind) {
      case TokenKind::Minus: {
        advance();
        const Token & num = expect(TokenKind::Number, "after '-' in pattern");
        auto * n = cast<NumberLiteral>(parse_number(num));
        n->value = -n->value;
        n->text = intern("-" + std::string(n->text));
        n->range_ = range_from(lt);
        return n;
      }
      case TokenKind::Number:
        advance();
        return parse_number(lt);
      case TokenKind::String:
        advance();
        return make<StringLiteral>(intern(lt.value), lt.range);
      case TokenKind::KwTrue:
      case TokenKind::KwFalse:
        advance();
        return make<BoolLiteral>(lt.kind == TokenKind::KwTrue, lt.range);
      case TokenKind::KwNil:
        advance();
        return make<NilLiteral>(lt.range);
      default:
        error_at(lt, "Expected pattern, found " + describe(lt), error_codes::k_unexpected_token);
    }
  };

  Expr * lit = literal();
  if ((at(TokenKind::DotDot) || at(TokenKind::DotDotEq)) &&
      (isa<NumberLiteral>(lit) || isa<StringLiteral>(lit))) {
    const bool inclusive = advance().kind == TokenKind::DotDotEq;
    Expr * end = literal();
    return make<RangePattern>(lit, end, inclusive, range_from(t));
  }
  return make<LiteralPattern>(lit, range_from(t));
}

void Parser::check_pattern_bindings(const Pattern * root)
{
  std::unordered_set<std::string_view> seen;
  std::function<void(const Pattern *)> walk = [&](const Pattern * p) {
    if (const auto * b = dyn_cast<BindingPattern>(p)) {
      if (!seen.insert(b->name).second) {
        error_at(
          b->get_range(), "Duplicate binding '" + std::string(b->name) + "' in pattern",
          error_codes::k_unexpected_token);
      }
    } else if (const auto * v = dyn_cast<VariantPattern>(p)) {
      for (const Pattern * f : v->fields) walk(f);
    } else if (const auto * a = dyn_cast<ArrayPattern>(p)) {
      for (const Pattern * e : a->elements) walk(e);
    } else if (const auto * t = dyn_cast<TuplePattern>(p)) {
      for (const Pattern * e : t->elements) walk(e);
    }
  };
  walk(root);
}

// ============================================================================
// JSX
// ============================================================================

Expr * Parser::parse_jsx_element()
{
  const Token & start = expect(TokenKind::JsxTagOpen, "");
  const std::string_view tag = expect_name("tag name");
  auto * element = make<JsxElement>(tag);

  std::vector<JsxAttribute *> attributes;
  while (!at(TokenKind::Gt) && !at(TokenKind::Slash) && !at_eof()) {
    attributes.push_back(parse_jsx_attribute());
  }
  element->attributes = to_span(attributes);

  if (match(TokenKind::Slash)) {
    expect(TokenKind::Gt, "to close self-closing tag");
    element->selfClosing = true;
    element->range_ = range_from(start);
    return element;
  }
  expect(TokenKind::Gt, "to close opening tag");
  element->children = to_span(parse_jsx_children(tag));
  element->range_ = range_from(start);
  return element;
}

JsxAttribute * Parser::parse_jsx_attribute()
{
  const Token & start = cur();
  if (at(TokenKind::LBrace) && cur(1).kind == TokenKind::Ellipsis) {
    advance();
    advance();
    auto * attr = make<JsxAttribute>(JsxAttributeKind::Spread, std::string_view{});
    attr->value = parse_expr();
    expect(TokenKind::RBrace, "to close spread attribute");
    attr->range_ = range_from(start);
    return attr;
  }

  std::string_view name = expect_name("attribute name");
  JsxAttributeKind kind = JsxAttributeKind::Plain;
  if (at(TokenKind::Colon) && (name == "on" || name == "bind" || name == "use")) {
    kind = name == "on"     ? JsxAttributeKind::Event
           : name == "bind" ? JsxAttributeKind::Bind
                            : JsxAttributeKind::Use;
    advance();
    name = expect_name("directive name");
  }

  auto * attr = make<JsxAttribute>(kind, name);
  if (match(TokenKind::Eq)) {
    const Token & vt = cur();
    if (at(TokenKind::String)) {
      advance();
      attr->value = make<StringLiteral>(intern(vt.value), vt.range);
    } else if (at(TokenKind::Template)) {
      advance();
      attr->value = parse_template(vt);
    } else if (match(TokenKind::LBrace)) {
      attr->value = parse_expr();
      expect(TokenKind::RBrace, "to close attribute expression");
    } else {
      error_at(
        vt, "Expected attribute value, found " + describe(vt), error_codes::k_unexpected_token);
    }
  }
  attr->range_ = range_from(start);
  return attr;
}

std::vector<AstNode *> Parser::parse_jsx_children(std::string_view tag)
{
  std::vector<AstNode *> children;
  while (true) {
    if (at_eof()) {
      error_at(
        cur(), "Unterminated JSX element <" + std::string(tag) + ">",
        error_codes::k_expected_closing);
    }
    if (at(TokenKind::JsxTagOpen) && cur(1).kind == TokenKind::Slash) {
      advance();
      advance();
      const Token & close = cur();
      const std::string_view name = expect_name("closing tag name");
      if (name != tag) {
        error_at(
          close,
          "Mismatched closing tag: expected </" + std::string(tag) + "> but found </" +
            std::string(name) + ">",
          error_codes::k_mismatched_jsx_tag);
      }
      expect(TokenKind::Gt, "to close closing tag");
      return children;
    }
    children.push_back(parse_jsx_child());
  }
}

AstNode * Parser::parse_jsx_child()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::JsxText:
      advance();
      return make<JsxText>(intern(t.value), t.range);
    case TokenKind::JsxTagOpen:
      return parse_jsx_element();
    case TokenKind::LBrace: {
      advance();
      Expr * e = parse_expr();
      expect(TokenKind::RBrace, "to close JSX expression");
      return make<JsxExprChild>(e, range_from(t));
    }
    case TokenKind::KwIf:
      return parse_jsx_if();
    case TokenKind::KwFor:
      return parse_jsx_for();
    default:
      break;
  }
  error_at(
    t, "Unexpected " + describe(t) + " in JSX children", error_codes::k_unexpected_token);
}

std::vector<AstNode *> Parser::parse_jsx_control_body()
{
  expect(TokenKind::LBrace, "to open JSX block");
  std::vector<AstNode *> children;
  while (!at(TokenKind::RBrace)) {
    if (at_eof()) {
      error_at(cur(), "Unterminated JSX block", error_codes::k_expected_closing);
    }
    children.push_back(parse_jsx_child());
  }
  advance();  // }
  return children;
}

AstNode * Parser::parse_jsx_if()
{
  const Token & start = advance();  // if
  auto * node = make<JsxIf>(parse_expr());
  node->children = to_span(parse_jsx_control_body());

  std::vector<JsxIf *> elifs;
  while (at(TokenKind::KwElif) || (at(TokenKind::KwElse) && cur(1).kind == TokenKind::KwIf)) {
    const Token & bs = cur();
    if (advance().kind == TokenKind::KwElse) {
      advance();
    }
    auto * branch = make<JsxIf>(parse_expr());
    branch->children = to_span(parse_jsx_control_body());
    branch->range_ = range_from(bs);
    elifs.push_back(branch);
  }
  node->elifs = to_span(elifs);

  if (match(TokenKind::KwElse)) {
    node->hasElse = true;
    node->elseChildren = to_span(parse_jsx_control_body());
  }
  node->range_ = range_from(start);
  return node;
}

AstNode * Parser::parse_jsx_for()
{
  const Token & start = advance();  // for
  const std::string_view var = expect_name("loop variable");
  std::string_view second;
  if (match(TokenKind::Comma)) {
    second = expect_name("second loop variable");
  }
  expect(TokenKind::KwIn, "after loop variable");
  auto * node = make<JsxFor>(var, parse_expr());
  node->secondVar = second;
  if (at_ident("key") && cur(1).kind == TokenKind::Eq) {
    advance();
    advance();
    expect(TokenKind::LBrace, "to open key expression");
    node->key = parse_expr();
    expect(TokenKind::RBrace, "to close key expression");
  }
  node->children = to_span(parse_jsx_control_body());
  node->range_ = range_from(start);
  return node;
}

}  // namespace tova::syntax
