// tova/sema/analyzer.cpp - Semantic analyzer implementation
//
#include "tova/sema/analyzer.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "tova/basic/casting.hpp"
#include "tova/basic/error_codes.hpp"
#include "tova/basic/errors.hpp"
#include "tova/sema/builtins.hpp"
#include "tova/sema/naming.hpp"
#include "tova/sema/types/type_utils.hpp"

namespace tova
{

namespace ec = error_codes;

namespace
{

std::string quoted(std::string_view name) { return "'" + std::string(name) + "'"; }

std::string plural_arguments(size_t n)
{
  return std::to_string(n) + (n == 1 ? " argument" : " arguments");
}

bool is_terminator(const Stmt * stmt)
{
  return isa<ReturnStmt>(stmt) || isa<BreakStmt>(stmt) || isa<ContinueStmt>(stmt);
}

bool is_catch_all(const MatchArm * arm)
{
  return isa<WildcardPattern>(arm->pattern) ||
         (isa<BindingPattern>(arm->pattern) && arm->guard == nullptr);
}

bool is_string_literal(const Expr * e) { return isa<StringLiteral>(e) || isa<TemplateLiteral>(e); }

std::vector<std::string_view> to_vector(gsl::span<std::string_view> names)
{
  return {names.begin(), names.end()};
}

bool definitely_returns(gsl::span<Stmt *> body);

bool stmt_returns(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::ReturnStmt:
      return true;

    case NodeKind::IfStmt: {
      const auto * s = cast<IfStmt>(stmt);
      if (!s->hasElse) return false;
      if (!definitely_returns(s->thenBody) || !definitely_returns(s->elseBody)) return false;
      return std::all_of(s->elifs.begin(), s->elifs.end(), [](const ElifClause * elif) {
        return definitely_returns(elif->body);
      });
    }

    case NodeKind::TryStmt: {
      const auto * s = cast<TryStmt>(stmt);
      return definitely_returns(s->body) && (!s->hasCatch || definitely_returns(s->catchBody));
    }

    case NodeKind::ExprStmt: {
      const auto * match = dyn_cast<MatchExpr>(cast<ExprStmt>(stmt)->expr);
      if (!match) return false;
      if (std::none_of(match->arms.begin(), match->arms.end(), is_catch_all)) return false;
      return std::all_of(match->arms.begin(), match->arms.end(), [](const MatchArm * arm) {
        return arm->isBlock && definitely_returns(arm->body);
      });
    }

    default:
      // A guard only handles the failing case; loops may run zero times.
      return false;
  }
}

bool definitely_returns(gsl::span<Stmt *> body)
{
  if (body.empty()) return false;
  if (std::any_of(body.begin(), body.end(), stmt_returns)) return true;
  return isa<ExprStmt>(body.back());
}

const Type * builtin_variant_payload(
  TypeContext & types, const Type * subject, std::string_view variant)
{
  if (!subject || subject->kind != TypeKind::Generic) return types.unknown_type();
  if (subject->name == "Result" && !subject->elements.empty()) {
    if (variant == "Ok") return subject->elements[0];
    if (variant == "Err" && subject->elements.size() > 1) return subject->elements[1];
  }
  if (subject->name == "Option" && variant == "Some" && !subject->elements.empty()) {
    return subject->elements[0];
  }
  return types.unknown_type();
}

}  // namespace

// ============================================================================
// Construction / Entry Point
// ============================================================================

Analyzer::Analyzer(const SourceManager & sm, AnalyzerOptions options)
: sm_(sm), options_(options), diags_(&sm_)
{
}

AnalysisResult Analyzer::analyze(Program * program)
{
  Scope prelude(ScopeContext::Module);
  for (const auto name : builtins::stdlib_names()) {
    Symbol sym{name, SymbolKind::Builtin};
    sym.used = true;
    prelude.define(std::move(sym));
  }
  for (const auto name : builtins::runtime_names()) {
    Symbol sym{name, SymbolKind::Builtin};
    sym.used = true;
    if (name == "None") sym.type = types_.get_generic_type("Option", {});
    prelude.define(std::move(sym));
  }

  Scope module(ScopeContext::Module, &prelude);
  module_scope_ = &module;
  current_scope_ = &module;

  if (program) {
    declare_types(program->body, module);
    // Shared declarations are visible from every region regardless of
    // source order.
    for (Stmt * stmt : program->body) {
      auto * block = dyn_cast<NamedBlock>(stmt);
      if (block && block->blockKind == BlockKind::Shared) {
        hoist_declarations(block->body, module);
      }
    }
    analyze_block(program->body);
  }

  current_scope_ = nullptr;
  module_scope_ = nullptr;

  AnalysisResult result{diags_.warnings(), diags_.errors()};
  if (!result.errors.empty() && !options_.tolerant) {
    throw AnalysisError(result.errors, result.warnings);
  }
  return result;
}

// ============================================================================
// Diagnostics
// ============================================================================

void Analyzer::error(
  SourceRange range, std::string message, std::string_view code, std::optional<std::string> hint)
{
  auto builder = diags_.report_error(range, std::move(message));
  if (!code.empty()) builder.with_code(std::string(code));
  if (hint) builder.with_hint(std::move(*hint));
}

void Analyzer::warning(
  SourceRange range, std::string message, std::string_view code, std::optional<std::string> hint)
{
  auto builder = diags_.report_warning(range, std::move(message));
  if (!code.empty()) builder.with_code(std::string(code));
  if (hint) builder.with_hint(std::move(*hint));
}

void Analyzer::strict_error(
  SourceRange range, std::string message, std::string_view code, std::optional<std::string> hint)
{
  if (options_.strict) {
    error(range, std::move(message), code, std::move(hint));
  } else {
    warning(range, std::move(message), code, std::move(hint));
  }
}

void Analyzer::check_naming(
  std::string_view name, std::string_view label, bool pascal, SourceRange range)
{
  if (name.empty() || name.front() == '_' || name.size() == 1) return;
  if (naming::is_upper_snake_case(name)) return;

  if (pascal) {
    if (naming::is_pascal_case(name)) return;
    const std::string fixed = naming::to_pascal_case(name);
    warning(
      range, std::string(label) + " " + quoted(name) + " should use PascalCase",
      ec::k_naming_convention, "Rename " + quoted(name) + " to " + quoted(fixed));
    return;
  }

  if (naming::is_snake_case(name)) return;
  const std::string fixed = naming::to_snake_case(name);
  warning(
    range, std::string(label) + " " + quoted(name) + " should use snake_case",
    ec::k_naming_convention, "Rename " + quoted(name) + " to " + quoted(fixed));
}

std::optional<std::string> Analyzer::suggest(std::string_view name) const
{
  std::vector<std::string_view> candidates = current_scope_->visible_names();
  const auto & globals = builtins::js_global_names();
  candidates.insert(candidates.end(), globals.begin(), globals.end());
  if (auto match = naming::closest_match(name, candidates)) {
    return "did you mean " + quoted(*match) + "?";
  }
  return std::nullopt;
}

// ============================================================================
// Scopes
// ============================================================================

void Analyzer::enter_scope(Scope & scope) { current_scope_ = &scope; }

void Analyzer::leave_scope(Scope & scope, Scope * saved)
{
  if (!frames_.empty()) {
    report_unused(scope);
  }
  current_scope_ = saved;
}

void Analyzer::report_unused(Scope & scope)
{
  for (const auto name : scope.names()) {
    const Symbol * sym = scope.lookup_local(name);
    if (!sym || sym->used || name.front() == '_') continue;
    switch (sym->kind) {
      case SymbolKind::Builtin:
      case SymbolKind::Parameter:
      case SymbolKind::Type:
      case SymbolKind::Import:
      case SymbolKind::Variant:
        continue;
      default:
        break;
    }
    warning(
      sym->definitionRange, quoted(name) + " is declared but never used", ec::k_unused_variable,
      "prefix with _ to suppress");
  }
}

bool Analyzer::inside_loop() const
{
  for (const Scope * s = current_scope_; s != nullptr; s = s->get_parent()) {
    if (s->is_loop()) return true;
    if (s->is_boundary()) break;
  }
  return false;
}

void Analyzer::define_binding(
  std::string_view name, SymbolKind kind, const Type * type, bool is_mutable, SourceRange range,
  std::string_view naming_label)
{
  if (name.empty() || name == "_") return;

  if (kind == SymbolKind::Variable && current_scope_->defined_beyond_boundary(name)) {
    warning(
      range, "Variable " + quoted(name) + " shadows a binding in an outer scope",
      ec::k_shadowed_binding);
  }

  Symbol sym{name, kind, type, is_mutable, range};
  if (!current_scope_->define(std::move(sym))) {
    error(range, quoted(name) + " is already defined in this scope", ec::k_duplicate);
    return;
  }
  if (!naming_label.empty()) {
    check_naming(name, naming_label, false, range);
  }
}

// ============================================================================
// Type Declarations
// ============================================================================

const Type * Analyzer::resolve(const TypeNode * node, gsl::span<const std::string_view> type_params)
{
  if (!node) return nullptr;
  return resolve_type_node(types_, typeTable_, node, type_params);
}

const Type * Analyzer::element_type_of(const Type * iterable)
{
  if (iterable && iterable->kind == TypeKind::Array && iterable->element_type) {
    return iterable->element_type;
  }
  if (iterable && iterable->kind == TypeKind::String) return types_.string_type();
  return types_.unknown_type();
}

void Analyzer::declare_types(gsl::span<Stmt *> body, Scope & target)
{
  std::vector<const Decl *> pending;
  std::vector<gsl::span<Stmt *>> worklist{body};
  while (!worklist.empty()) {
    const auto stmts = worklist.back();
    worklist.pop_back();
    for (const Stmt * stmt : stmts) {
      if (const auto * block = dyn_cast<NamedBlock>(stmt)) {
        worklist.push_back(block->body);
        continue;
      }
      if (!isa<TypeDecl>(stmt) && !isa<TypeAliasDecl>(stmt) && !isa<InterfaceDecl>(stmt)) continue;
      if (declaredTypes_.insert(stmt).second) {
        pending.push_back(cast<Decl>(stmt));
      }
    }
  }

  // Names first so that declarations may reference each other in any order.
  for (const Decl * decl : pending) declare_type_name(decl, target);
  for (const Decl * decl : pending) resolve_type_decl(decl, target);
}

void Analyzer::declare_type_name(const Decl * decl, Scope & target)
{
  std::string_view name;
  const Type * type = nullptr;

  if (const auto * td = dyn_cast<TypeDecl>(decl)) {
    name = td->name;
    if (typeTable_.contains(name)) {
      error(td->get_range(), quoted(name) + " is already defined in this scope", ec::k_duplicate);
      return;
    }
    if (td->is_adt()) {
      type = types_.create_adt_type(name, to_vector(td->typeParams), td);
    } else {
      type = types_.create_record_type(name, td);
    }
  } else if (const auto * alias = dyn_cast<TypeAliasDecl>(decl)) {
    name = alias->name;
  } else if (const auto * iface = dyn_cast<InterfaceDecl>(decl)) {
    name = iface->name;
    type = types_.get_generic_type(name, {});
  }

  if (!typeTable_.define(TypeSymbol{name, type, decl})) {
    error(decl->get_range(), quoted(name) + " is already defined in this scope", ec::k_duplicate);
    return;
  }
  check_naming(name, "Type", true, decl->get_range());

  Symbol sym{name, SymbolKind::Type, type, false, decl->get_range()};
  sym.used = true;
  sym.astNode = decl;
  target.upsert(std::move(sym));
}

void Analyzer::resolve_type_decl(const Decl * decl, Scope & target)
{
  if (const auto * alias = dyn_cast<TypeAliasDecl>(decl)) {
    const auto params = to_vector(alias->typeParams);
    const Type * aliased = resolve(alias->aliasedType, params);
    typeTable_.set_type(alias->name, aliased);
    if (Symbol * sym = target.lookup_local(alias->name)) sym->type = aliased;
    return;
  }

  const auto * td = dyn_cast<TypeDecl>(decl);
  if (!td) return;
  const TypeSymbol * symbol = typeTable_.lookup(td->name);
  if (!symbol || symbol->decl != td) return;
  // Types are created by this analyzer and only exposed as const.
  auto * type = const_cast<Type *>(symbol->type);
  const auto params = to_vector(td->typeParams);

  if (!td->is_adt()) {
    std::vector<std::string_view> names;
    std::vector<const Type *> field_types;
    for (const TypeField * field : td->fields) {
      names.push_back(field->name);
      field_types.push_back(field->type ? resolve(field->type, params) : types_.unknown_type());
    }
    types_.set_record_fields(type, names, field_types);
    return;
  }

  for (const TypeVariant * variant : td->variants) {
    std::vector<std::string_view> names;
    std::vector<const Type *> field_types;
    for (const TypeField * field : variant->fields) {
      names.push_back(field->name);
      field_types.push_back(field->type ? resolve(field->type, params) : nullptr);
    }
    types_.add_variant(type, variant->name, names, field_types);

    Symbol ctor{variant->name, SymbolKind::Variant, type, false, variant->get_range()};
    ctor.paramNames = names;
    ctor.paramTypes = field_types;
    ctor.typeParams = params;
    ctor.requiredParams = names.size();
    ctor.totalParams = names.size();
    ctor.hasSignature = !names.empty();
    ctor.used = true;
    ctor.astNode = variant;
    target.upsert(std::move(ctor));
  }
}

// ============================================================================
// Blocks
// ============================================================================

Symbol Analyzer::make_function_symbol(const FunctionDecl * fn)
{
  Symbol sym{fn->name, SymbolKind::Function, nullptr, false, fn->get_range()};
  sym.typeParams = to_vector(fn->typeParams);

  std::vector<const Type *> param_types;
  for (const Param * param : fn->params) {
    const Type * t = resolve(param->type, sym.typeParams);
    sym.paramNames.push_back(param->name);
    sym.paramTypes.push_back(t);
    param_types.push_back(t ? t : types_.unknown_type());
    if (!param->defaultValue) ++sym.requiredParams;
  }
  sym.totalParams = fn->params.size();
  sym.hasSignature = true;

  const Type * ret = resolve(fn->returnType, sym.typeParams);
  sym.type = types_.get_function_type(param_types, ret ? ret : types_.unknown_type());
  sym.astNode = fn;
  return sym;
}

void Analyzer::hoist_declarations(gsl::span<Stmt *> body, Scope & target)
{
  auto hoist = [&](Symbol sym, SourceRange range) {
    const std::string_view name = sym.name;
    if (Symbol * existing = target.lookup_local(name)) {
      if (existing->astNode == sym.astNode) return;
      error(range, quoted(name) + " is already defined in this scope", ec::k_duplicate);
      return;
    }
    target.define(std::move(sym));
  };

  for (Stmt * stmt : body) {
    if (auto * fn = dyn_cast<FunctionDecl>(stmt)) {
      hoist(make_function_symbol(fn), fn->get_range());
    } else if (auto * mw = dyn_cast<MiddlewareDecl>(stmt)) {
      hoist(make_function_symbol(mw->function), mw->get_range());
    } else if (auto * comp = dyn_cast<ComponentDecl>(stmt)) {
      Symbol sym{comp->name, SymbolKind::Component, nullptr, false, comp->get_range()};
      sym.astNode = comp;
      hoist(std::move(sym), comp->get_range());
    } else if (auto * store = dyn_cast<StoreDecl>(stmt)) {
      Symbol sym{store->name, SymbolKind::Store, nullptr, false, store->get_range()};
      sym.astNode = store;
      hoist(std::move(sym), store->get_range());
    }
  }
}

void Analyzer::analyze_block(gsl::span<Stmt *> body)
{
  declare_types(body, *current_scope_);
  hoist_declarations(body, *current_scope_);

  for (size_t i = 0; i < body.size(); ++i) {
    visit(body[i]);
    if (is_terminator(body[i]) && i + 1 < body.size()) {
      warning(
        body[i + 1]->get_range(), "Unreachable code after return/break/continue",
        ec::k_unreachable_code);
      break;
    }
  }
}

void Analyzer::analyze_scoped_block(gsl::span<Stmt *> body, bool is_loop)
{
  Scope block(ScopeContext::Block, current_scope_);
  block.set_loop(is_loop);
  Scope * saved = current_scope_;
  enter_scope(block);
  analyze_block(body);
  leave_scope(block, saved);
}

void Analyzer::define_params(
  gsl::span<Param *> params, gsl::span<const std::string_view> type_params)
{
  for (Param * param : params) {
    if (param->defaultValue) check_expr(param->defaultValue);
    const Type * t = resolve(param->type, type_params);
    Symbol sym{param->name, SymbolKind::Parameter, t, false, param->get_range()};
    if (!current_scope_->define(std::move(sym))) {
      error(param->get_range(), "Duplicate parameter " + quoted(param->name), ec::k_duplicate);
      continue;
    }
    check_naming(param->name, "Parameter", false, param->get_range());
  }
}

void Analyzer::analyze_function_body(
  std::string_view name, gsl::span<Stmt *> body, const Type * return_type, SourceRange range)
{
  analyze_block(body);

  if (return_type && !definitely_returns(body)) {
    const std::string subject = name.empty() ? "Lambda" : "Function " + quoted(name);
    warning(
      range,
      subject + " declares return type " + to_string(return_type) +
        " but not all code paths return a value",
      ec::k_missing_return);
  }
}

// ============================================================================
// Expressions
// ============================================================================

const Type * Analyzer::check_expr(Expr * expr)
{
  if (!expr) return types_.unknown_type();
  const Type * t = visit(expr);
  if (!t) t = types_.unknown_type();
  expr->resolvedType = t;
  return t;
}

const Type * Analyzer::visit_number_literal(NumberLiteral * node)
{
  return node->isFloat ? types_.float_type() : types_.int_type();
}

const Type * Analyzer::visit_string_literal(StringLiteral * /*node*/)
{
  return types_.string_type();
}

const Type * Analyzer::visit_template_literal(TemplateLiteral * node)
{
  for (Expr * part : node->parts) check_expr(part);
  return types_.string_type();
}

const Type * Analyzer::visit_bool_literal(BoolLiteral * /*node*/) { return types_.bool_type(); }

const Type * Analyzer::visit_nil_literal(NilLiteral * /*node*/) { return types_.nil_type(); }

const Type * Analyzer::visit_identifier(Identifier * node)
{
  if (node->name == "_") return types_.unknown_type();

  if (Symbol * sym = current_scope_->lookup(node->name)) {
    sym->used = true;
    return sym->type ? sym->type : types_.unknown_type();
  }
  if (builtins::is_known_global(node->name)) {
    return types_.unknown_type();
  }

  warning(
    node->get_range(), quoted(node->name) + " is not defined", ec::k_undefined,
    suggest(node->name));
  return types_.unknown_type();
}

void Analyzer::check_binary_operands(BinaryExpr * node, const Type * lhs, const Type * rhs)
{
  if (!both_known(lhs, rhs)) return;

  auto numeric_hint = [](const Type * t) -> std::optional<std::string> {
    if (t->kind == TypeKind::String) {
      return std::string("try toInt(value) or toFloat(value) to parse");
    }
    return std::nullopt;
  };
  auto mismatch = [&](const Type * offending) {
    strict_error(
      node->get_range(),
      "Type mismatch: '" + std::string(to_string(node->op)) + "' expects numeric type, but got " +
        to_string(offending),
      ec::k_type_mismatch, numeric_hint(offending));
  };

  switch (node->op) {
    case BinaryOp::Mul:
      if (is_string_literal(node->lhs) || is_string_literal(node->rhs)) return;
      [[fallthrough]];
    case BinaryOp::Sub:
    case BinaryOp::Div:
    case BinaryOp::Mod:
    case BinaryOp::Pow:
      if (!lhs->is_numeric()) {
        mismatch(lhs);
      } else if (!rhs->is_numeric()) {
        mismatch(rhs);
      }
      return;

    case BinaryOp::Add:
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
      if (lhs->is_numeric() && rhs->is_numeric()) return;
      if (lhs->kind == TypeKind::String && rhs->kind == TypeKind::String) return;
      mismatch(lhs->is_numeric() ? rhs : lhs);
      return;

    default:
      return;
  }
}

const Type * Analyzer::visit_binary_expr(BinaryExpr * node)
{
  const Type * lhs = check_expr(node->lhs);
  const Type * rhs = check_expr(node->rhs);
  check_binary_operands(node, lhs, rhs);

  auto arithmetic = [&]() -> const Type * {
    if (!lhs->is_numeric() || !rhs->is_numeric()) return types_.unknown_type();
    if (lhs->kind == TypeKind::Float || rhs->kind == TypeKind::Float) return types_.float_type();
    return types_.int_type();
  };

  switch (node->op) {
    case BinaryOp::Add:
      if (lhs->kind == TypeKind::String && rhs->kind == TypeKind::String) {
        return types_.string_type();
      }
      return arithmetic();
    case BinaryOp::Mul:
      if (is_string_literal(node->lhs) || is_string_literal(node->rhs)) return types_.string_type();
      return arithmetic();
    case BinaryOp::Div:
      return lhs->is_numeric() && rhs->is_numeric() ? types_.float_type() : types_.unknown_type();
    case BinaryOp::Sub:
    case BinaryOp::Mod:
    case BinaryOp::Pow:
      return arithmetic();
    case BinaryOp::Eq:
    case BinaryOp::Ne:
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
    case BinaryOp::And:
    case BinaryOp::Or:
      return types_.bool_type();
    case BinaryOp::Coalesce:
      return lhs->is_opaque() || lhs->kind == TypeKind::Nil ? rhs : lhs;
  }
  return types_.unknown_type();
}

const Type * Analyzer::visit_unary_expr(UnaryExpr * node)
{
  const Type * operand = check_expr(node->operand);
  if (node->op == UnaryOp::Not) return types_.bool_type();

  if (!operand->is_opaque() && !operand->is_numeric()) {
    strict_error(
      node->get_range(), "Type mismatch: '-' expects numeric type, but got " + to_string(operand),
      ec::k_type_mismatch);
    return types_.unknown_type();
  }
  return operand;
}

const Type * Analyzer::visit_chained_comparison(ChainedComparison * node)
{
  for (Expr * operand : node->operands) check_expr(operand);
  return types_.bool_type();
}

const Type * Analyzer::visit_membership_expr(MembershipExpr * node)
{
  check_expr(node->value);
  check_expr(node->collection);
  return types_.bool_type();
}

const Type * Analyzer::visit_range_expr(RangeExpr * node)
{
  check_expr(node->start);
  check_expr(node->end);
  return types_.get_array_type(types_.int_type());
}

const Type * Analyzer::visit_named_argument(NamedArgument * node)
{
  return check_expr(node->value);
}

const Type * Analyzer::visit_call_expr(CallExpr * node) { return check_call(node, 0); }

const Type * Analyzer::check_builtin_call(
  std::string_view name, const std::vector<const Type *> & args)
{
  const Type * first = args.empty() ? types_.unknown_type() : args.front();
  if (name == "Ok") return types_.get_generic_type("Result", {first, types_.unknown_type()});
  if (name == "Err") return types_.get_generic_type("Result", {types_.unknown_type(), first});
  if (name == "Some") return types_.get_generic_type("Option", {first});
  if (name == "len" || name == "count" || name == "toInt") return types_.int_type();
  if (name == "type_of" || name == "toString" || name == "upper" || name == "lower" ||
      name == "trim" || name == "capitalize") {
    return types_.string_type();
  }
  if (name == "toFloat" || name == "random" || name == "sqrt") return types_.float_type();
  if (name == "range") return types_.get_array_type(types_.int_type());
  return types_.unknown_type();
}

void Analyzer::check_arity(
  CallExpr * node, std::string_view name, const Symbol & fn, size_t implicit_args)
{
  size_t positional = implicit_args;
  bool has_named = false;
  for (const Expr * arg : node->args) {
    if (isa<SpreadExpr>(arg)) return;
    if (isa<NamedArgument>(arg)) {
      has_named = true;
    } else {
      ++positional;
    }
  }
  // Named arguments are passed as one trailing object.
  const size_t actual = positional + (has_named ? 1 : 0);

  if (actual > fn.totalParams) {
    error(
      node->get_range(),
      quoted(name) + " expects " + plural_arguments(fn.totalParams) + ", but got " +
        std::to_string(actual),
      ec::k_wrong_argument_count);
  } else if (actual < fn.requiredParams) {
    error(
      node->get_range(),
      quoted(name) + " expects at least " + plural_arguments(fn.requiredParams) + ", but got " +
        std::to_string(actual),
      ec::k_wrong_argument_count);
  }
}

void Analyzer::check_argument_types(CallExpr * node, const Symbol & fn, size_t implicit_args)
{
  const auto is_spread = [](const Expr * a) { return isa<SpreadExpr>(a); };
  if (std::any_of(node->args.begin(), node->args.end(), is_spread)) {
    return;
  }

  auto param_index = [&](size_t arg_index) { return arg_index + implicit_args; };

  // Bind bare type parameters from the first argument that fixes them.
  std::unordered_map<std::string_view, const Type *> bindings;
  for (size_t i = 0; i < node->args.size() && param_index(i) < fn.paramTypes.size(); ++i) {
    const Expr * arg = node->args[i];
    const Type * param = fn.paramTypes[param_index(i)];
    if (isa<NamedArgument>(arg) || !param || !arg->resolvedType) continue;
    if (arg->resolvedType->is_opaque()) continue;
    if (param->kind == TypeKind::TypeVariable) {
      bindings.emplace(param->name, arg->resolvedType);
    } else if (param->kind == TypeKind::Array && param->element_type &&
               param->element_type->kind == TypeKind::TypeVariable &&
               arg->resolvedType->kind == TypeKind::Array) {
      bindings.emplace(param->element_type->name, arg->resolvedType->element_type);
    }
  }

  for (size_t i = 0; i < node->args.size() && param_index(i) < fn.paramTypes.size(); ++i) {
    const Expr * arg = node->args[i];
    const Type * expected = fn.paramTypes[param_index(i)];
    if (isa<NamedArgument>(arg) || !expected) continue;
    if (expected->kind == TypeKind::TypeVariable) {
      auto it = bindings.find(expected->name);
      if (it == bindings.end()) continue;
      expected = it->second;
    }
    const Type * actual = arg->resolvedType;
    if (is_assignable(expected, actual)) continue;

    error(
      arg->get_range(),
      "Type mismatch: " + quoted(fn.paramNames[param_index(i)]) + " expects " +
        to_string(expected) + ", but got " + to_string(actual),
      ec::k_invalid_argument_type, conversion_hint(expected, actual));
  }
}

const Type * Analyzer::check_call(CallExpr * node, size_t implicit_args)
{
  // `Type.new(...)` constructs a record.
  if (auto * member = dyn_cast<MemberExpr>(node->callee); member && member->property == "new") {
    if (auto * id = dyn_cast<Identifier>(member->object)) {
      if (const TypeSymbol * ts = typeTable_.lookup(id->name)) {
        if (Symbol * sym = current_scope_->lookup(id->name)) sym->used = true;
        for (Expr * arg : node->args) check_expr(arg);
        const Type * t = ts->type ? ts->type : types_.unknown_type();
        id->resolvedType = t;
        member->resolvedType = types_.unknown_type();
        node->callee->resolvedType = types_.unknown_type();
        return t;
      }
    }
  }

  const Type * callee_type = check_expr(node->callee);
  std::vector<const Type *> arg_types;
  arg_types.reserve(node->args.size());
  for (Expr * arg : node->args) arg_types.push_back(check_expr(arg));

  if (const auto * id = dyn_cast<Identifier>(node->callee)) {
    Symbol * sym = current_scope_->lookup(id->name);
    if (!sym || sym->kind == SymbolKind::Builtin) {
      return check_builtin_call(id->name, arg_types);
    }
    if (sym->hasSignature) {
      check_arity(node, id->name, *sym, implicit_args);
      check_argument_types(node, *sym, implicit_args);
    }
    if (sym->kind == SymbolKind::Variant || sym->kind == SymbolKind::Type) {
      return sym->type ? sym->type : types_.unknown_type();
    }
  }

  if (callee_type->kind == TypeKind::Function && callee_type->return_type) {
    return callee_type->return_type;
  }
  return types_.unknown_type();
}

const Type * Analyzer::visit_member_expr(MemberExpr * node)
{
  const Type * object = check_expr(node->object);
  if (object->kind == TypeKind::Record) {
    for (size_t i = 0; i < object->field_names.size(); ++i) {
      if (object->field_names[i] == node->property) return object->elements[i];
    }
  }
  if (node->property == "length" &&
      (object->kind == TypeKind::Array || object->kind == TypeKind::String)) {
    return types_.int_type();
  }
  return types_.unknown_type();
}

const Type * Analyzer::visit_index_expr(IndexExpr * node)
{
  const Type * object = check_expr(node->object);
  check_expr(node->index);
  if (object->kind == TypeKind::Array || object->kind == TypeKind::String) {
    return element_type_of(object);
  }
  return types_.unknown_type();
}

const Type * Analyzer::visit_slice_expr(SliceExpr * node)
{
  const Type * object = check_expr(node->object);
  if (node->start) check_expr(node->start);
  if (node->end) check_expr(node->end);
  if (node->step) check_expr(node->step);
  if (object->kind == TypeKind::Array || object->kind == TypeKind::String) return object;
  return types_.unknown_type();
}

const Type * Analyzer::visit_propagate_expr(PropagateExpr * node)
{
  const Type * operand = check_expr(node->operand);
  if (operand->kind == TypeKind::Generic && !operand->elements.empty() &&
      (operand->name == "Result" || operand->name == "Option")) {
    return operand->elements[0];
  }
  return types_.unknown_type();
}

const Type * Analyzer::visit_await_expr(AwaitExpr * node)
{
  // Top-level and region-level code may await.
  if (!frames_.empty() && !frames_.back().isAsync) {
    error(
      node->get_range(), "'await' can only be used inside an async function",
      ec::k_await_outside_async, "add 'async' to the enclosing function declaration");
  }
  return check_expr(node->operand);
}

const Type * Analyzer::visit_spread_expr(SpreadExpr * node) { return check_expr(node->operand); }

const Type * Analyzer::visit_lambda_expr(LambdaExpr * node)
{
  Scope fn_scope(ScopeContext::Function, current_scope_);
  Scope * saved = current_scope_;
  enter_scope(fn_scope);
  define_params(node->params, {});

  frames_.push_back(FunctionFrame{nullptr, node->isAsync});
  const Type * result = types_.unknown_type();
  if (node->isBlock) {
    analyze_block(node->body);
  } else {
    result = check_expr(node->bodyExpr);
  }
  leave_scope(fn_scope, saved);
  frames_.pop_back();

  std::vector<const Type *> params;
  for (const Param * p : node->params) {
    const Type * t = resolve(p->type);
    params.push_back(t ? t : types_.unknown_type());
  }
  return types_.get_function_type(params, result);
}

const Type * Analyzer::visit_match_expr(MatchExpr * node)
{
  const Type * subject = check_expr(node->subject);

  bool catch_all_seen = false;
  const Type * result = nullptr;
  bool uniform = true;

  for (MatchArm * arm : node->arms) {
    if (catch_all_seen) {
      warning(
        arm->pattern->get_range(), "Unreachable match arm after catch-all pattern",
        ec::k_unreachable_arm);
    }

    Scope arm_scope(ScopeContext::Block, current_scope_);
    Scope * saved = current_scope_;
    enter_scope(arm_scope);
    bind_pattern(arm->pattern, subject);
    if (arm->guard) check_expr(arm->guard);
    if (arm->isBlock) {
      analyze_block(arm->body);
      uniform = false;
    } else {
      const Type * t = check_expr(arm->bodyExpr);
      if (!result) {
        result = t;
      } else if (result != t) {
        uniform = false;
      }
    }
    leave_scope(arm_scope, saved);

    if (is_catch_all(arm)) catch_all_seen = true;
  }

  check_exhaustiveness(node, subject);
  return uniform && result ? result : types_.unknown_type();
}

void Analyzer::bind_pattern(Pattern * pattern, const Type * expected)
{
  switch (pattern->get_kind()) {
    case NodeKind::BindingPattern: {
      const auto * p = cast<BindingPattern>(pattern);
      define_binding(p->name, SymbolKind::Variable, expected, false, p->get_range(), {});
      return;
    }

    case NodeKind::LiteralPattern:
      check_expr(cast<LiteralPattern>(pattern)->literal);
      return;

    case NodeKind::RangePattern: {
      auto * p = cast<RangePattern>(pattern);
      check_expr(p->start);
      check_expr(p->end);
      return;
    }

    case NodeKind::VariantPattern: {
      auto * p = cast<VariantPattern>(pattern);
      const VariantInfo * info = nullptr;
      if (expected && expected->kind == TypeKind::Adt) {
        info = expected->find_variant(p->name);
      }
      if (Symbol * ctor = current_scope_->lookup(p->name)) {
        ctor->used = true;
        if (!info && ctor->kind == SymbolKind::Variant && ctor->type) {
          info = ctor->type->find_variant(p->name);
        }
      }
      for (size_t i = 0; i < p->fields.size(); ++i) {
        const Type * field = types_.unknown_type();
        if (info && i < info->fieldTypes.size() && info->fieldTypes[i]) {
          field = info->fieldTypes[i];
        } else if (!info) {
          field = builtin_variant_payload(types_, expected, p->name);
        }
        bind_pattern(p->fields[i], field);
      }
      return;
    }

    case NodeKind::ArrayPattern: {
      const Type * elem = element_type_of(expected);
      for (Pattern * e : cast<ArrayPattern>(pattern)->elements) bind_pattern(e, elem);
      return;
    }

    case NodeKind::TuplePattern: {
      auto * p = cast<TuplePattern>(pattern);
      for (size_t i = 0; i < p->elements.size(); ++i) {
        const Type * elem = types_.unknown_type();
        if (expected && expected->kind == TypeKind::Tuple && i < expected->elements.size()) {
          elem = expected->elements[i];
        }
        bind_pattern(p->elements[i], elem);
      }
      return;
    }

    default:
      return;
  }
}

void Analyzer::check_exhaustiveness(MatchExpr * node, const Type * subject_type)
{
  if (std::any_of(node->arms.begin(), node->arms.end(), is_catch_all)) return;

  std::vector<std::string_view> covered;
  for (const MatchArm * arm : node->arms) {
    if (const auto * v = dyn_cast<VariantPattern>(arm->pattern)) covered.push_back(v->name);
  }
  if (covered.empty()) return;

  auto is_covered = [&](std::string_view name) {
    return std::find(covered.begin(), covered.end(), name) != covered.end();
  };
  auto report_missing = [&](const Type * adt) {
    for (const VariantInfo & v : adt->variants) {
      if (is_covered(v.name)) continue;
      warning(
        node->get_range(),
        "Non-exhaustive match: missing " + quoted(v.name) + " variant from type " +
          quoted(adt->name),
        ec::k_non_exhaustive_match,
        "add a " + quoted(v.name) + " arm or use '_ =>' as a catch-all");
    }
  };

  if (subject_type && subject_type->kind == TypeKind::Adt) {
    report_missing(subject_type);
    return;
  }

  auto check_pair = [&](std::string_view a, std::string_view a_hint, std::string_view b,
                        std::string_view b_hint) {
    if (!is_covered(a) && !is_covered(b)) return;
    if (!is_covered(a)) {
      warning(
        node->get_range(), "Non-exhaustive match: missing " + quoted(a) + " variant",
        ec::k_non_exhaustive_match, std::string(a_hint));
    }
    if (!is_covered(b)) {
      warning(
        node->get_range(), "Non-exhaustive match: missing " + quoted(b) + " variant",
        ec::k_non_exhaustive_match, std::string(b_hint));
    }
  };
  check_pair("Ok", "add an 'Ok(value) =>' arm", "Err", "add an 'Err(e) =>' arm");
  check_pair("Some", "add a 'Some(value) =>' arm", "None", "add a 'None =>' arm");

  // Without a precise subject type, only a single ADT that declares every
  // covered variant is a safe guess.
  std::vector<const Type *> candidates;
  for (const Type * adt : typeTable_.adt_types()) {
    const bool contains_all = std::all_of(covered.begin(), covered.end(), [adt](std::string_view n) {
      return adt->find_variant(n) != nullptr;
    });
    if (contains_all) candidates.push_back(adt);
  }
  if (candidates.size() == 1) {
    report_missing(candidates.front());
  }
}

const Type * Analyzer::visit_if_expr(IfExpr * node)
{
  check_expr(node->condition);
  analyze_scoped_block(node->thenBody);
  for (ElifClause * elif : node->elifs) {
    check_expr(elif->condition);
    analyze_scoped_block(elif->body);
  }
  analyze_scoped_block(node->elseBody);
  return types_.unknown_type();
}

const Type * Analyzer::visit_array_literal(ArrayLiteral * node)
{
  const Type * elem = nullptr;
  bool uniform = true;
  for (Expr * e : node->elements) {
    const Type * t = check_expr(e);
    if (isa<SpreadExpr>(e)) {
      uniform = false;
      continue;
    }
    if (!elem) {
      elem = t;
    } else if (elem != t) {
      uniform = false;
    }
  }
  return types_.get_array_type(uniform && elem ? elem : types_.unknown_type());
}

const Type * Analyzer::visit_object_literal(ObjectLiteral * node)
{
  for (ObjectProperty * prop : node->properties) check_expr(prop->value);
  return types_.unknown_type();
}

const Type * Analyzer::visit_list_comprehension(ListComprehension * node)
{
  const Type * iterable = check_expr(node->iterable);
  Scope scope(ScopeContext::Block, current_scope_);
  Scope * saved = current_scope_;
  enter_scope(scope);
  if (node->secondVar.empty()) {
    define_binding(
      node->variable, SymbolKind::Variable, element_type_of(iterable), false, node->get_range(), {});
  } else {
    define_binding(node->variable, SymbolKind::Variable, nullptr, false, node->get_range(), {});
    define_binding(node->secondVar, SymbolKind::Variable, nullptr, false, node->get_range(), {});
  }
  if (node->condition) check_expr(node->condition);
  const Type * elem = check_expr(node->element);
  leave_scope(scope, saved);
  return types_.get_array_type(elem);
}

const Type * Analyzer::visit_dict_comprehension(DictComprehension * node)
{
  const Type * iterable = check_expr(node->iterable);
  Scope scope(ScopeContext::Block, current_scope_);
  Scope * saved = current_scope_;
  enter_scope(scope);
  if (node->secondVar.empty()) {
    define_binding(
      node->variable, SymbolKind::Variable, element_type_of(iterable), false, node->get_range(), {});
  } else {
    define_binding(node->variable, SymbolKind::Variable, nullptr, false, node->get_range(), {});
    define_binding(node->secondVar, SymbolKind::Variable, nullptr, false, node->get_range(), {});
  }
  if (node->condition) check_expr(node->condition);
  check_expr(node->key);
  check_expr(node->value);
  leave_scope(scope, saved);
  return types_.unknown_type();
}

const Type * Analyzer::visit_tuple_expr(TupleExpr * node)
{
  std::vector<const Type *> elements;
  for (Expr * e : node->elements) elements.push_back(check_expr(e));
  return types_.get_tuple_type(elements);
}

const Type * Analyzer::visit_pipe_expr(PipeExpr * node)
{
  check_expr(node->lhs);
  if (auto * call = dyn_cast<CallExpr>(node->rhs)) {
    // The piped value fills the first parameter unless a `_` placeholder
    // marks its position explicitly.
    const bool has_placeholder = std::any_of(call->args.begin(), call->args.end(), [](const Expr * a) {
      const auto * id = dyn_cast<Identifier>(a);
      return id && id->name == "_";
    });
    const Type * t = check_call(call, has_placeholder ? 0 : 1);
    call->resolvedType = t;
    return t;
  }
  const Type * fn = check_expr(node->rhs);
  if (fn->kind == TypeKind::Function && fn->return_type) return fn->return_type;
  return types_.unknown_type();
}

const Type * Analyzer::visit_spawn_expr(SpawnExpr * node)
{
  check_expr(node->operand);
  return types_.unknown_type();
}

const Type * Analyzer::visit_jsx_element(JsxElement * node)
{
  if (!node->tag.empty() && std::isupper(static_cast<unsigned char>(node->tag.front()))) {
    if (Symbol * sym = current_scope_->lookup(node->tag)) sym->used = true;
  }
  for (JsxAttribute * attr : node->attributes) {
    if (attr->value) check_expr(attr->value);
  }

  // Children are not Exprs; walk them with an explicit stack.
  std::vector<AstNode *> stack(node->children.rbegin(), node->children.rend());
  while (!stack.empty()) {
    AstNode * child = stack.back();
    stack.pop_back();
    if (auto * el = dyn_cast<JsxElement>(child)) {
      check_expr(el);
    } else if (auto * ec_child = dyn_cast<JsxExprChild>(child)) {
      check_expr(ec_child->expr);
    } else if (auto * jfor = dyn_cast<JsxFor>(child)) {
      const Type * iterable = check_expr(jfor->iterable);
      Scope scope(ScopeContext::Block, current_scope_);
      Scope * saved = current_scope_;
      enter_scope(scope);
      define_binding(
        jfor->variable, SymbolKind::Variable, element_type_of(iterable), false, jfor->get_range(),
        {});
      if (!jfor->secondVar.empty()) {
        define_binding(
          jfor->secondVar, SymbolKind::Variable, nullptr, false, jfor->get_range(), {});
      }
      if (jfor->key) check_expr(jfor->key);
      for (AstNode * c : jfor->children) {
        if (auto * e = dyn_cast<JsxElement>(c)) {
          check_expr(e);
        } else if (auto * x = dyn_cast<JsxExprChild>(c)) {
          check_expr(x->expr);
        }
      }
      // Loop variables are commonly used only for their key or not at all.
      if (Symbol * v = scope.lookup_local(jfor->variable)) v->used = true;
      leave_scope(scope, saved);
    } else if (auto * jif = dyn_cast<JsxIf>(child)) {
      check_expr(jif->condition);
      stack.insert(stack.end(), jif->children.rbegin(), jif->children.rend());
      for (JsxIf * elif : jif->elifs) stack.push_back(elif);
      stack.insert(stack.end(), jif->elseChildren.rbegin(), jif->elseChildren.rend());
    }
  }
  return types_.unknown_type();
}

// ============================================================================
// Statements
// ============================================================================

const Type * Analyzer::visit_expr_stmt(ExprStmt * node)
{
  check_expr(node->expr);
  return nullptr;
}

const Type * Analyzer::visit_assignment(Assignment * node)
{
  std::vector<const Type *> values;
  for (Expr * v : node->values) values.push_back(check_expr(v));

  // `a, b = pair` destructures a tuple value.
  if (node->targets.size() > 1 && values.size() == 1 && values[0]->kind == TypeKind::Tuple) {
    const Type * tuple = values[0];
    values.assign(tuple->elements.begin(), tuple->elements.end());
  }

  const Type * annotated = resolve(node->type);

  for (size_t i = 0; i < node->targets.size(); ++i) {
    Expr * target = node->targets[i];
    const Type * value = i < values.size() ? values[i] : types_.unknown_type();

    auto * id = dyn_cast<Identifier>(target);
    if (!id) {
      check_expr(target);
      continue;
    }
    if (id->name == "_") continue;

    Symbol * existing = current_scope_->lookup_to_boundary(id->name);
    if (!existing) {
      Symbol * outer = current_scope_->lookup(id->name);
      if (outer && outer->kind == SymbolKind::State) existing = outer;
    }

    if (existing) {
      existing->used = true;
      id->resolvedType = existing->type ? existing->type : types_.unknown_type();
      const bool reassignable = existing->isMutable || existing->kind == SymbolKind::State ||
                                existing->kind == SymbolKind::Parameter;
      if (!reassignable) {
        error(
          node->get_range(),
          "Cannot reassign immutable variable " + quoted(id->name) +
            ". Use 'var' for mutable variables.",
          ec::k_immutable_reassign);
      }
      if (existing->type && !is_assignable(existing->type, value)) {
        strict_error(
          node->get_range(),
          "Type mismatch: " + quoted(id->name) + " is " + to_string(existing->type) +
            ", but assigned " + to_string(value),
          ec::k_cannot_assign, conversion_hint(existing->type, value));
      }
      if (options_.strict && existing->type && existing->type->kind == TypeKind::Int &&
          value->kind == TypeKind::Float) {
        warning(
          node->get_range(),
          "Potential data loss: assigning Float to Int variable " + quoted(id->name),
          ec::k_possible_data_loss, "use floor() or round() for explicit conversion");
      }
      continue;
    }

    if (annotated && !is_assignable(annotated, value)) {
      error(
        node->get_range(),
        "Type mismatch: " + quoted(id->name) + " declared as " + to_string(annotated) +
          ", but got " + to_string(value),
        ec::k_type_mismatch, conversion_hint(annotated, value));
    }
    const Type * type = annotated ? annotated : value;
    id->resolvedType = type;
    define_binding(id->name, SymbolKind::Variable, type, false, target->get_range(), "Variable");
  }
  return nullptr;
}

const Type * Analyzer::visit_var_decl(VarDecl * node)
{
  std::vector<const Type *> values;
  for (Expr * v : node->values) values.push_back(check_expr(v));
  if (node->names.size() > 1 && values.size() == 1 && values[0]->kind == TypeKind::Tuple) {
    const Type * tuple = values[0];
    values.assign(tuple->elements.begin(), tuple->elements.end());
  }

  const Type * annotated = resolve(node->type);
  for (size_t i = 0; i < node->names.size(); ++i) {
    const std::string_view name = node->names[i];
    const Type * value = i < values.size() ? values[i] : types_.unknown_type();
    if (annotated && !is_assignable(annotated, value)) {
      error(
        node->get_range(),
        "Type mismatch: " + quoted(name) + " declared as " + to_string(annotated) + ", but got " +
          to_string(value),
        ec::k_type_mismatch, conversion_hint(annotated, value));
    }
    define_binding(
      name, SymbolKind::Variable, annotated ? annotated : value, true, node->get_range(),
      "Variable");
  }
  return nullptr;
}

const Type * Analyzer::visit_let_destructure(LetDestructure * node)
{
  const Type * value = check_expr(node->value);
  std::vector<std::string_view> seen;
  for (size_t i = 0; i < node->names.size(); ++i) {
    const std::string_view name = node->names[i];
    if (std::find(seen.begin(), seen.end(), name) != seen.end()) {
      error(
        node->get_range(), "Duplicate binding " + quoted(name) + " in destructuring pattern",
        ec::k_duplicate);
      continue;
    }
    seen.push_back(name);

    const Type * t = types_.unknown_type();
    if (node->isObject && value->kind == TypeKind::Record) {
      for (size_t f = 0; f < value->field_names.size(); ++f) {
        if (value->field_names[f] == node->keys[i]) t = value->elements[f];
      }
    } else if (!node->isObject) {
      t = element_type_of(value);
    }
    define_binding(name, SymbolKind::Variable, t, false, node->get_range(), "Variable");
  }
  return nullptr;
}

const Type * Analyzer::visit_compound_assign(CompoundAssign * node)
{
  const Type * value = check_expr(node->value);
  const std::string op(to_string(node->op));

  auto * id = dyn_cast<Identifier>(node->target);
  if (!id) {
    check_expr(node->target);
    return nullptr;
  }

  Symbol * sym = current_scope_->lookup(id->name);
  if (!sym) {
    check_expr(node->target);
    return nullptr;
  }
  sym->used = true;
  id->resolvedType = sym->type ? sym->type : types_.unknown_type();

  const bool reassignable = sym->isMutable || sym->kind == SymbolKind::State ||
                            sym->kind == SymbolKind::Parameter || sym->kind == SymbolKind::Builtin;
  if (!reassignable) {
    error(
      node->get_range(),
      "Cannot use '" + op + "' on immutable variable " + quoted(id->name),
      ec::k_immutable_reassign, "declare with 'var' to make mutable");
  }

  const Type * target = sym->type;
  if (!both_known(target, value)) return nullptr;

  if (node->op != AssignOp::AddAssign && !target->is_numeric()) {
    strict_error(
      node->get_range(),
      "Type mismatch: '" + op + "' requires numeric type, but " + quoted(id->name) + " is " +
        to_string(target),
      ec::k_type_mismatch);
  } else if (target->is_numeric() && !value->is_numeric()) {
    strict_error(
      node->get_range(),
      "Type mismatch: '" + op + "' on numeric variable requires numeric value, but got " +
        to_string(value),
      ec::k_type_mismatch);
  } else if (target->kind == TypeKind::String && value->kind != TypeKind::String) {
    strict_error(
      node->get_range(),
      "Type mismatch: '" + op + "' on String variable requires String value, but got " +
        to_string(value),
      ec::k_type_mismatch, "try toString(value) to convert");
  }
  return nullptr;
}

const Type * Analyzer::visit_if_stmt(IfStmt * node)
{
  check_expr(node->condition);
  analyze_scoped_block(node->thenBody);
  for (ElifClause * elif : node->elifs) {
    check_expr(elif->condition);
    analyze_scoped_block(elif->body);
  }
  if (node->hasElse) analyze_scoped_block(node->elseBody);
  return nullptr;
}

const Type * Analyzer::visit_for_stmt(ForStmt * node)
{
  const Type * iterable = check_expr(node->iterable);

  Scope loop(ScopeContext::Block, current_scope_);
  loop.set_loop(true);
  Scope * saved = current_scope_;
  enter_scope(loop);
  if (node->secondVar.empty()) {
    define_binding(
      node->variable, SymbolKind::Variable, element_type_of(iterable), false, node->get_range(),
      "Variable");
  } else {
    define_binding(
      node->variable, SymbolKind::Variable, nullptr, false, node->get_range(), "Variable");
    define_binding(
      node->secondVar, SymbolKind::Variable, nullptr, false, node->get_range(), "Variable");
  }
  analyze_block(node->body);
  leave_scope(loop, saved);

  if (node->hasElse) analyze_scoped_block(node->elseBody);
  return nullptr;
}

const Type * Analyzer::visit_while_stmt(WhileStmt * node)
{
  check_expr(node->condition);
  analyze_scoped_block(node->body, true);
  return nullptr;
}

const Type * Analyzer::visit_try_stmt(TryStmt * node)
{
  analyze_scoped_block(node->body);
  if (node->hasCatch) {
    Scope scope(ScopeContext::Block, current_scope_);
    Scope * saved = current_scope_;
    enter_scope(scope);
    if (!node->catchParam.empty()) {
      Symbol param{node->catchParam, SymbolKind::Parameter, nullptr, false, node->get_range()};
      current_scope_->define(std::move(param));
    }
    analyze_block(node->catchBody);
    leave_scope(scope, saved);
  }
  if (node->hasFinally) analyze_scoped_block(node->finallyBody);
  return nullptr;
}

const Type * Analyzer::visit_return_stmt(ReturnStmt * node)
{
  const Type * actual = node->value ? check_expr(node->value) : types_.nil_type();
  if (frames_.empty()) {
    error(node->get_range(), "'return' can only be used inside a function");
    return nullptr;
  }

  const Type * expected = frames_.back().returnType;
  if (expected && !is_assignable(expected, actual)) {
    error(
      node->get_range(),
      "Type mismatch: function expects return type " + to_string(expected) + ", but got " +
        to_string(actual),
      ec::k_return_type_mismatch, conversion_hint(expected, actual));
  }
  return nullptr;
}

const Type * Analyzer::visit_break_stmt(BreakStmt * node)
{
  if (!inside_loop()) error(node->get_range(), "'break' can only be used inside a loop");
  return nullptr;
}

const Type * Analyzer::visit_continue_stmt(ContinueStmt * node)
{
  if (!inside_loop()) error(node->get_range(), "'continue' can only be used inside a loop");
  return nullptr;
}

const Type * Analyzer::visit_guard_stmt(GuardStmt * node)
{
  check_expr(node->condition);
  analyze_scoped_block(node->elseBody);
  return nullptr;
}

const Type * Analyzer::visit_concurrent_block(ConcurrentBlock * node)
{
  if (node->timeout) check_expr(node->timeout);
  // Results bound inside the block stay visible after it.
  analyze_block(node->body);
  return nullptr;
}

const Type * Analyzer::visit_select_stmt(SelectStmt * node)
{
  for (SelectCase * c : node->cases) {
    if (c->channel) check_expr(c->channel);
    if (c->value) check_expr(c->value);

    Scope scope(ScopeContext::Block, current_scope_);
    Scope * saved = current_scope_;
    enter_scope(scope);
    if (c->caseKind == SelectCaseKind::Receive) {
      define_binding(c->binding, SymbolKind::Variable, nullptr, false, c->get_range(), "Variable");
    }
    analyze_block(c->body);
    leave_scope(scope, saved);
  }
  return nullptr;
}

// ============================================================================
// Declarations
// ============================================================================

const Type * Analyzer::visit_function_decl(FunctionDecl * node)
{
  check_naming(node->name, "Function", false, node->get_range());

  const auto type_params = to_vector(node->typeParams);
  const Type * return_type = resolve(node->returnType, type_params);

  Scope fn_scope(ScopeContext::Function, current_scope_);
  Scope * saved = current_scope_;
  enter_scope(fn_scope);
  define_params(node->params, type_params);

  frames_.push_back(FunctionFrame{return_type, node->isAsync});
  analyze_function_body(node->name, node->body, return_type, node->get_range());
  leave_scope(fn_scope, saved);
  frames_.pop_back();
  return nullptr;
}

const Type * Analyzer::visit_import_decl(ImportDecl * node)
{
  auto define_import = [&](std::string_view name) {
    Symbol sym{name, SymbolKind::Import, nullptr, false, node->get_range()};
    sym.used = true;
    if (!current_scope_->define(std::move(sym))) {
      error(node->get_range(), quoted(name) + " is already defined in this scope", ec::k_duplicate);
    }
  };
  if (!node->defaultName.empty()) define_import(node->defaultName);
  for (size_t i = 0; i < node->names.size(); ++i) define_import(node->local_name(i));
  return nullptr;
}

const Type * Analyzer::visit_named_block(NamedBlock * node)
{
  ScopeContext context = ScopeContext::Module;
  switch (node->blockKind) {
    case BlockKind::Shared:
      context = ScopeContext::Shared;
      break;
    case BlockKind::Client:
      context = ScopeContext::Client;
      break;
    case BlockKind::Server:
      context = ScopeContext::Server;
      break;
    case BlockKind::Edge:
      context = ScopeContext::Edge;
      break;
    case BlockKind::Cli:
      context = ScopeContext::Module;
      break;
    case BlockKind::Deploy:
    case BlockKind::Security:
      // Pure configuration.
      return nullptr;
  }

  Scope region(context, current_scope_);
  Scope * saved = current_scope_;
  enter_scope(region);
  analyze_block(node->body);
  current_scope_ = saved;

  if (node->blockKind == BlockKind::Shared && module_scope_) {
    for (const auto name : region.names()) {
      if (const Symbol * sym = region.lookup_local(name)) module_scope_->upsert(*sym);
    }
  }
  return nullptr;
}

const Type * Analyzer::visit_state_decl(StateDecl * node)
{
  if (current_scope_->region_context() != ScopeContext::Client) {
    error(node->get_range(), "'state' can only be used inside a client block");
  }
  const Type * value = check_expr(node->init);
  const Type * annotated = resolve(node->type);
  if (annotated && !is_assignable(annotated, value)) {
    error(
      node->get_range(),
      "Type mismatch: " + quoted(node->name) + " declared as " + to_string(annotated) +
        ", but got " + to_string(value),
      ec::k_type_mismatch, conversion_hint(annotated, value));
  }
  define_binding(
    node->name, SymbolKind::State, annotated ? annotated : value, true, node->get_range(),
    "Variable");
  return nullptr;
}

const Type * Analyzer::visit_computed_decl(ComputedDecl * node)
{
  if (current_scope_->region_context() != ScopeContext::Client) {
    error(node->get_range(), "'computed' can only be used inside a client block");
  }
  const Type * value = check_expr(node->expr);
  define_binding(node->name, SymbolKind::Computed, value, false, node->get_range(), "Variable");
  return nullptr;
}

const Type * Analyzer::visit_effect_decl(EffectDecl * node)
{
  if (current_scope_->region_context() != ScopeContext::Client) {
    error(node->get_range(), "'effect' can only be used inside a client block");
  }
  analyze_scoped_block(node->body);
  return nullptr;
}

const Type * Analyzer::visit_component_decl(ComponentDecl * node)
{
  if (current_scope_->region_context() != ScopeContext::Client) {
    error(node->get_range(), "'component' can only be used inside a client block");
  }
  check_naming(node->name, "Component", true, node->get_range());

  Scope fn_scope(ScopeContext::Function, current_scope_);
  Scope * saved = current_scope_;
  enter_scope(fn_scope);
  define_params(node->params, {});
  frames_.push_back(FunctionFrame{nullptr, false});
  analyze_block(node->body);
  leave_scope(fn_scope, saved);
  frames_.pop_back();
  return nullptr;
}

const Type * Analyzer::visit_store_decl(StoreDecl * node)
{
  if (current_scope_->region_context() != ScopeContext::Client) {
    error(node->get_range(), "'store' can only be used inside a client block");
  }
  check_naming(node->name, "Store", true, node->get_range());
  analyze_scoped_block(node->body);
  return nullptr;
}

const Type * Analyzer::visit_route_decl(RouteDecl * node)
{
  const ScopeContext region = current_scope_->region_context();
  if (region != ScopeContext::Server && region != ScopeContext::Edge) {
    error(node->get_range(), "'route' can only be used inside a server or edge block");
  }
  check_expr(node->handler);
  return nullptr;
}

const Type * Analyzer::visit_middleware_decl(MiddlewareDecl * node)
{
  return visit_function_decl(node->function);
}

const Type * Analyzer::visit_edge_binding(EdgeBinding * node)
{
  if (node->defaultValue) check_expr(node->defaultValue);
  Symbol sym{node->name, SymbolKind::Variable, nullptr, false, node->get_range()};
  sym.used = true;
  if (!current_scope_->define(std::move(sym))) {
    error(
      node->get_range(), quoted(node->name) + " is already defined in this scope",
      ec::k_duplicate);
  }
  return nullptr;
}

}  // namespace tova
