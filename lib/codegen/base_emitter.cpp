// tova/codegen/base_emitter.cpp - Expression/statement lowering shared by all targets
#include "tova/codegen/base_emitter.hpp"

#include <fmt/format.h>

#include <cctype>
#include <nlohmann/json.hpp>

#include "tova/ast/visitor.hpp"
#include "tova/basic/errors.hpp"
#include "tova/sema/types/type.hpp"

namespace tova::codegen
{

// ============================================================================
// Free helpers
// ============================================================================

std::string_view node_kind_name(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_NAME(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#define AST_NODE_EXPR AST_NODE_NAME
#define AST_NODE_TYPE AST_NODE_NAME
#define AST_NODE_STMT AST_NODE_NAME
#define AST_NODE_DECL AST_NODE_NAME
#define AST_NODE_PATTERN AST_NODE_NAME
#define AST_NODE_SUPPORT AST_NODE_NAME
#define AST_NODE_TOP AST_NODE_NAME
#include "tova/ast/ast_nodes.def"
#undef AST_NODE_NAME
  }
  return "unknown";
}

std::string quote_js(std::string_view s)
{
  return nlohmann::json(std::string(s))
    .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string capitalize(std::string_view s)
{
  std::string out(s);
  if (!out.empty()) {
    out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
  }
  return out;
}

std::string render_type(const TypeNode * type)
{
  if (type == nullptr) {
    return "Any";
  }
  switch (type->get_kind()) {
    case NodeKind::NamedType: {
      const auto * nt = cast<NamedType>(type);
      std::string out(nt->name);
      if (!nt->typeArgs.empty()) {
        out += '<';
        for (size_t i = 0; i < nt->typeArgs.size(); ++i) {
          if (i > 0) out += ", ";
          out += render_type(nt->typeArgs[i]);
        }
        out += '>';
      }
      return out;
    }
    case NodeKind::ArrayType:
      return "[" + render_type(cast<ArrayType>(type)->elementType) + "]";
    case NodeKind::TupleType: {
      std::string out = "(";
      const auto * tt = cast<TupleType>(type);
      for (size_t i = 0; i < tt->elements.size(); ++i) {
        if (i > 0) out += ", ";
        out += render_type(tt->elements[i]);
      }
      return out + ")";
    }
    case NodeKind::FunctionType: {
      const auto * ft = cast<FunctionType>(type);
      std::string out = "fn(";
      for (size_t i = 0; i < ft->params.size(); ++i) {
        if (i > 0) out += ", ";
        out += render_type(ft->params[i]);
      }
      out += ")";
      if (ft->returnType != nullptr) out += " -> " + render_type(ft->returnType);
      return out;
    }
    default:
      return "Any";
  }
}

namespace
{

/// Finds a node of interest without crossing into nested functions.
template <typename Derived>
class FunctionLocalFinder : public ConstRecursiveAstVisitor<Derived>
{
public:
  bool found = false;

  bool visit_lambda_expr(const LambdaExpr * /*node*/) { return true; }
  bool visit_function_decl(const FunctionDecl * /*node*/) { return true; }
  bool visit_middleware_decl(const MiddlewareDecl * /*node*/) { return true; }
};

class PropagateFinder : public FunctionLocalFinder<PropagateFinder>
{
public:
  bool visit_propagate_expr(const PropagateExpr * /*node*/)
  {
    found = true;
    return false;
  }
};

class AsyncFinder : public FunctionLocalFinder<AsyncFinder>
{
public:
  bool visit_concurrent_block(const ConcurrentBlock * /*node*/)
  {
    found = true;
    return false;
  }

  bool visit_select_stmt(const SelectStmt * /*node*/)
  {
    found = true;
    return false;
  }
};

template <typename Finder>
bool find_in(gsl::span<Stmt *> body)
{
  Finder finder;
  for (const Stmt * s : body) {
    if (!finder.visit(s)) break;
  }
  return finder.found;
}

[[nodiscard]] std::string_view js_operator(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Eq:
      return "===";
    case BinaryOp::Ne:
      return "!==";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    default:
      return to_string(op);
  }
}

[[nodiscard]] bool is_placeholder(const Expr * e)
{
  const auto * id = dyn_cast<Identifier>(e);
  return id != nullptr && id->name == "_";
}

[[nodiscard]] bool is_catch_all(const Pattern * p)
{
  return isa<WildcardPattern>(p) || isa<BindingPattern>(p);
}

[[nodiscard]] std::string_view escape_template_text_char(char c)
{
  switch (c) {
    case '`':
      return "\\`";
    case '$':
      return "\\$";
    case '\\':
      return "\\\\";
    default:
      return {};
  }
}

}  // namespace

bool is_js_identifier(std::string_view s) noexcept
{
  if (s.empty()) return false;
  const auto head = static_cast<unsigned char>(s[0]);
  if (!(std::isalpha(head) || s[0] == '_' || s[0] == '$')) return false;
  for (const char c : s) {
    const auto u = static_cast<unsigned char>(c);
    if (!(std::isalnum(u) || c == '_' || c == '$')) return false;
  }
  return true;
}

std::string join(const std::vector<std::string> & parts, std::string_view sep)
{
  std::string out;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) out += sep;
    out += parts[i];
  }
  return out;
}

bool contains_propagate(gsl::span<Stmt *> body) { return find_in<PropagateFinder>(body); }

bool contains_propagate(const Expr * expr)
{
  PropagateFinder finder;
  finder.visit(expr);
  return finder.found;
}

bool needs_async(gsl::span<Stmt *> body) { return find_in<AsyncFinder>(body); }

// ============================================================================
// BaseEmitter - scaffolding
// ============================================================================

BaseEmitter::BaseEmitter(EmitContext & ctx) : ctx_(ctx) { scopes_.emplace_back(); }

bool BaseEmitter::is_declared(std::string_view name) const
{
  const std::string key(name);
  for (const auto & scope : scopes_) {
    if (scope.count(key) != 0) return true;
  }
  return false;
}

std::string BaseEmitter::brace(const std::string & inner) const
{
  if (inner.empty()) return "{\n" + ind() + "}";
  return "{\n" + inner + "\n" + ind() + "}";
}

std::string BaseEmitter::emit_statements(gsl::span<Stmt *> stmts)
{
  std::string out;
  for (const Stmt * s : stmts) {
    std::string code = emit_stmt(s);
    if (code.empty()) continue;
    if (!out.empty()) out += '\n';
    out += code;
  }
  return out;
}

std::string BaseEmitter::emit_block(gsl::span<Stmt *> stmts)
{
  ++indent_;
  push_scope();
  std::string out = emit_statements(stmts);
  pop_scope();
  --indent_;
  return out;
}

std::string BaseEmitter::emit_body(gsl::span<Stmt *> stmts)
{
  ++indent_;
  std::string out;
  for (size_t i = 0; i < stmts.size(); ++i) {
    const Stmt * s = stmts[i];
    const bool last = i + 1 == stmts.size();
    std::string code;
    if (last && isa<ExprStmt>(s)) {
      code = ind() + "return " + emit_expr(cast<ExprStmt>(s)->expr) + ";";
    } else if (last && isa<IfStmt>(s) && cast<IfStmt>(s)->hasElse) {
      code = emit_if_returns(cast<IfStmt>(s));
    } else {
      code = emit_stmt(s);
    }
    if (code.empty()) continue;
    if (!out.empty()) out += '\n';
    out += code;
  }
  --indent_;
  return out;
}

std::string BaseEmitter::emit_if_returns(const IfStmt * node)
{
  auto branch = [this](gsl::span<Stmt *> body) {
    push_scope();
    std::string b = emit_body(body);
    pop_scope();
    return brace(b);
  };
  std::string code = ind() + "if (" + emit_expr(node->condition) + ") " + branch(node->thenBody);
  for (const auto * elif : node->elifs) {
    code += " else if (" + emit_expr(elif->condition) + ") " + branch(elif->body);
  }
  code += " else " + branch(node->elseBody);
  return code;
}

std::string BaseEmitter::wrap_propagate(const std::string & body)
{
  const std::string in = ind() + "  ";
  return in + "try {\n" + body + "\n" + in + "} catch (__e) {\n" + in +
         "  if (__e instanceof __TovaPropagate) return __e.value;\n" + in + "  throw __e;\n" + in +
         "}";
}

// ============================================================================
// Expressions
// ============================================================================

std::string BaseEmitter::emit_expr(const Expr * expr)
{
  switch (expr->get_kind()) {
    case NodeKind::NumberLiteral:
      return std::string(cast<NumberLiteral>(expr)->text);
    case NodeKind::StringLiteral:
      return quote_js(cast<StringLiteral>(expr)->value);
    case NodeKind::TemplateLiteral:
      return emit_template(cast<TemplateLiteral>(expr));
    case NodeKind::BoolLiteral:
      return cast<BoolLiteral>(expr)->value ? "true" : "false";
    case NodeKind::NilLiteral:
      return "null";
    case NodeKind::Identifier:
      return emit_identifier(cast<Identifier>(expr));
    case NodeKind::BinaryExpr:
      return emit_binary(cast<BinaryExpr>(expr));
    case NodeKind::UnaryExpr: {
      const auto * u = cast<UnaryExpr>(expr);
      const std::string operand = emit_expr(u->operand);
      return u->op == UnaryOp::Not ? "(!" + operand + ")" : "(-" + operand + ")";
    }
    case NodeKind::ChainedComparison: {
      const auto * cc = cast<ChainedComparison>(expr);
      std::vector<std::string> parts;
      for (size_t i = 0; i < cc->ops.size(); ++i) {
        parts.push_back(fmt::format(
          "({} {} {})", emit_expr(cc->operands[i]), js_operator(cc->ops[i]),
          emit_expr(cc->operands[i + 1])));
      }
      return "(" + join(parts, " && ") + ")";
    }
    case NodeKind::MembershipExpr: {
      const auto * m = cast<MembershipExpr>(expr);
      std::string call =
        "__contains(" + emit_expr(m->collection) + ", " + emit_expr(m->value) + ")";
      return m->negated ? "(!" + call + ")" : call;
    }
    case NodeKind::RangeExpr: {
      const auto * r = cast<RangeExpr>(expr);
      const std::string start = emit_expr(r->start);
      const std::string end = emit_expr(r->end);
      return fmt::format(
        "Array.from({{length: {} - {}{}}}, (_, i) => {} + i)", end, start,
        r->inclusive ? " + 1" : "", start);
    }
    case NodeKind::CallExpr:
      return emit_call(cast<CallExpr>(expr));
    case NodeKind::NamedArgument:
      return emit_expr(cast<NamedArgument>(expr)->value);
    case NodeKind::MemberExpr: {
      const auto * m = cast<MemberExpr>(expr);
      return emit_expr(m->object) + (m->optional ? "?." : ".") + std::string(m->property);
    }
    case NodeKind::IndexExpr: {
      const auto * ix = cast<IndexExpr>(expr);
      return emit_expr(ix->object) + "[" + emit_expr(ix->index) + "]";
    }
    case NodeKind::SliceExpr:
      return emit_slice(cast<SliceExpr>(expr));
    case NodeKind::PropagateExpr:
      return "__propagate(" + emit_expr(cast<PropagateExpr>(expr)->operand) + ")";
    case NodeKind::AwaitExpr:
      return "(await " + emit_expr(cast<AwaitExpr>(expr)->operand) + ")";
    case NodeKind::SpreadExpr:
      return "..." + emit_expr(cast<SpreadExpr>(expr)->operand);
    case NodeKind::LambdaExpr:
      return emit_lambda(cast<LambdaExpr>(expr));
    case NodeKind::MatchExpr:
      return emit_match(cast<MatchExpr>(expr));
    case NodeKind::IfExpr:
      return emit_if_expr(cast<IfExpr>(expr));
    case NodeKind::ArrayLiteral:
    case NodeKind::TupleExpr: {
      const auto elements = isa<ArrayLiteral>(expr) ? cast<ArrayLiteral>(expr)->elements
                                                    : cast<TupleExpr>(expr)->elements;
      std::vector<std::string> parts;
      parts.reserve(elements.size());
      for (const Expr * e : elements) parts.push_back(emit_expr(e));
      return "[" + join(parts, ", ") + "]";
    }
    case NodeKind::ObjectLiteral:
      return emit_object(cast<ObjectLiteral>(expr));
    case NodeKind::ListComprehension:
      return emit_list_comprehension(cast<ListComprehension>(expr));
    case NodeKind::DictComprehension:
      return emit_dict_comprehension(cast<DictComprehension>(expr));
    case NodeKind::PipeExpr:
      return emit_pipe(cast<PipeExpr>(expr));
    case NodeKind::SpawnExpr:
      return "__spawn(async () => " + emit_expr(cast<SpawnExpr>(expr)->operand) + ")";
    case NodeKind::JsxElement:
      return emit_jsx_element(cast<JsxElement>(expr));
    default:
      break;
  }
  throw CodegenError(
    fmt::format(
      "no JavaScript lowering for expression node '{}'", node_kind_name(expr->get_kind())));
}

std::string BaseEmitter::emit_identifier(const Identifier * node)
{
  return std::string(node->name);
}

std::string BaseEmitter::emit_binary(const BinaryExpr * node)
{
  const std::string left = emit_expr(node->lhs);
  const std::string right = emit_expr(node->rhs);

  if (node->op == BinaryOp::Mul) {
    const bool string_lhs =
      isa<StringLiteral>(node->lhs) || isa<TemplateLiteral>(node->lhs) ||
      (node->lhs->resolvedType != nullptr && node->lhs->resolvedType->kind == TypeKind::String);
    if (string_lhs) {
      return left + ".repeat(" + right + ")";
    }
  }

  // NaN counts as missing.
  if (node->op == BinaryOp::Coalesce) {
    return "((__tova_v) => __tova_v != null && __tova_v === __tova_v ? __tova_v : " + right +
           ")(" + left + ")";
  }

  return fmt::format("({} {} {})", left, js_operator(node->op), right);
}

std::string BaseEmitter::emit_template(const TemplateLiteral * node)
{
  std::string out = "`";
  for (const Expr * part : node->parts) {
    if (const auto * text = dyn_cast<StringLiteral>(part)) {
      for (const char c : text->value) {
        const auto esc = escape_template_text_char(c);
        if (esc.empty()) {
          out += c;
        } else {
          out += esc;
        }
      }
    } else {
      out += "${" + emit_expr(part) + "}";
    }
  }
  return out + "`";
}

std::string BaseEmitter::emit_args(gsl::span<Expr *> args, const std::string * placeholder)
{
  std::vector<std::string> positional;
  std::vector<std::string> named;
  for (const Expr * a : args) {
    if (const auto * na = dyn_cast<NamedArgument>(a)) {
      named.push_back(std::string(na->name) + ": " + emit_expr(na->value));
    } else if (placeholder != nullptr && is_placeholder(a)) {
      positional.push_back(*placeholder);
    } else {
      positional.push_back(emit_expr(a));
    }
  }
  if (!named.empty()) {
    positional.push_back("{ " + join(named, ", ") + " }");
  }
  return join(positional, ", ");
}

std::string BaseEmitter::emit_call(const CallExpr * node)
{
  const auto * m = dyn_cast<MemberExpr>(node->callee);
  if (m && !m->optional && m->property == "new") {
    return "new " + emit_expr(m->object) + "(" + emit_args(node->args) + ")";
  }
  return emit_expr(node->callee) + "(" + emit_args(node->args) + ")";
}

std::string BaseEmitter::emit_pipe(const PipeExpr * node)
{
  const std::string left = emit_expr(node->lhs);
  const Expr * rhs = node->rhs;

  if (const auto * call = dyn_cast<CallExpr>(rhs)) {
    // x |> .method(args)
    if (const auto * m = dyn_cast<MemberExpr>(call->callee); m && is_placeholder(m->object)) {
      return left + "." + std::string(m->property) + "(" + emit_args(call->args, &left) + ")";
    }
    const std::string callee = emit_expr(call->callee);
    bool has_placeholder = false;
    for (const Expr * a : call->args) has_placeholder = has_placeholder || is_placeholder(a);
    if (has_placeholder) {
      return callee + "(" + emit_args(call->args, &left) + ")";
    }
    const std::string rest = emit_args(call->args);
    return callee + "(" + left + (rest.empty() ? "" : ", " + rest) + ")";
  }
  if (const auto * m = dyn_cast<MemberExpr>(rhs); m && is_placeholder(m->object)) {
    return left + "." + std::string(m->property);
  }
  if (isa<Identifier>(rhs) || isa<MemberExpr>(rhs)) {
    return emit_expr(rhs) + "(" + left + ")";
  }
  return "(" + emit_expr(rhs) + ")(" + left + ")";
}

std::string BaseEmitter::emit_object(const ObjectLiteral * node)
{
  if (node->properties.empty()) return "{}";
  std::vector<std::string> parts;
  for (const auto * p : node->properties) {
    if (p->key.empty()) {
      parts.push_back(emit_expr(p->value));  // spread
    } else if (p->shorthand) {
      const std::string value = emit_expr(p->value);
      if (value == p->key) {
        parts.emplace_back(p->key);
      } else {
        parts.push_back(std::string(p->key) + ": " + value);
      }
    } else {
      const std::string key = is_js_identifier(p->key) ? std::string(p->key) : quote_js(p->key);
      parts.push_back(key + ": " + emit_expr(p->value));
    }
  }
  return "{ " + join(parts, ", ") + " }";
}

std::string BaseEmitter::emit_slice(const SliceExpr * node)
{
  const std::string obj = emit_expr(node->object);
  if (node->step != nullptr) {
    const std::string s = node->start != nullptr ? emit_expr(node->start) : "null";
    const std::string e = node->end != nullptr ? emit_expr(node->end) : "null";
    return "((a, s, e, st) => { const r = []; if (st > 0) { for (let i = s !== null ? s : 0; i < "
           "(e !== null ? e : a.length); i += st) r.push(a[i]); } else { for (let i = s !== null ? "
           "s : a.length - 1; i > (e !== null ? e : -1); i += st) r.push(a[i]); } return r; })(" +
           obj + ", " + s + ", " + e + ", " + emit_expr(node->step) + ")";
  }
  if (node->start == nullptr && node->end == nullptr) return obj + ".slice()";
  if (node->start == nullptr) return obj + ".slice(0, " + emit_expr(node->end) + ")";
  if (node->end == nullptr) return obj + ".slice(" + emit_expr(node->start) + ")";
  return obj + ".slice(" + emit_expr(node->start) + ", " + emit_expr(node->end) + ")";
}

std::string BaseEmitter::emit_list_comprehension(const ListComprehension * node)
{
  const std::string iter = emit_expr(node->iterable);
  const std::string var = node->secondVar.empty()
                            ? std::string(node->variable)
                            : fmt::format("[{}, {}]", node->variable, node->secondVar);
  push_scope();
  declare(node->variable);
  if (!node->secondVar.empty()) declare(node->secondVar);
  const std::string element = emit_expr(node->element);
  std::string out = iter;
  if (node->condition != nullptr) {
    out += ".filter((" + var + ") => " + emit_expr(node->condition) + ")";
    if (element == var) {
      pop_scope();
      return out;
    }
  }
  out += ".map((" + var + ") => " + element + ")";
  pop_scope();
  return out;
}

std::string BaseEmitter::emit_dict_comprehension(const DictComprehension * node)
{
  const std::string iter = emit_expr(node->iterable);
  const std::string var = node->secondVar.empty()
                            ? std::string(node->variable)
                            : fmt::format("[{}, {}]", node->variable, node->secondVar);
  push_scope();
  declare(node->variable);
  if (!node->secondVar.empty()) declare(node->secondVar);
  std::string out = "Object.fromEntries(" + iter;
  if (node->condition != nullptr) {
    out += ".filter((" + var + ") => " + emit_expr(node->condition) + ")";
  }
  out += ".map((" + var + ") => [" + emit_expr(node->key) + ", " + emit_expr(node->value) + "]))";
  pop_scope();
  return out;
}

std::string BaseEmitter::emit_params(gsl::span<Param *> params)
{
  std::vector<std::string> parts;
  for (const auto * p : params) {
    if (p->defaultValue != nullptr) {
      parts.push_back(std::string(p->name) + " = " + emit_expr(p->defaultValue));
    } else {
      parts.emplace_back(p->name);
    }
  }
  return join(parts, ", ");
}

std::string BaseEmitter::emit_lambda(const LambdaExpr * node)
{
  const std::string params = emit_params(node->params);
  const bool is_async = node->isAsync || (node->isBlock && needs_async(node->body));
  const std::string prefix = is_async ? "async " : "";

  push_scope();
  for (const auto * p : node->params) declare(p->name);

  std::string out;
  if (node->isBlock) {
    const bool propagate = contains_propagate(node->body);
    if (propagate) ++indent_;
    std::string body = emit_body(node->body);
    if (propagate) {
      --indent_;
      body = wrap_propagate(body);
    }
    out = prefix + "(" + params + ") => " + brace(body);
  } else {
    std::string body = emit_expr(node->bodyExpr);
    if (contains_propagate(node->bodyExpr)) {
      out = prefix + "(" + params + ") => { try { return " + body +
            "; } catch (__e) { if (__e instanceof __TovaPropagate) return __e.value; throw __e; } }";
    } else if (isa<ObjectLiteral>(node->bodyExpr)) {
      out = prefix + "(" + params + ") => (" + body + ")";
    } else {
      out = prefix + "(" + params + ") => " + body;
    }
  }
  pop_scope();
  return out;
}

// ============================================================================
// Match / if-expression
// ============================================================================

std::string BaseEmitter::pattern_condition(const Pattern * pattern, const std::string & subject)
{
  switch (pattern->get_kind()) {
    case NodeKind::WildcardPattern:
    case NodeKind::BindingPattern:
      return "true";
    case NodeKind::LiteralPattern:
      return subject + " === " + emit_expr(cast<LiteralPattern>(pattern)->literal);
    case NodeKind::RangePattern: {
      const auto * r = cast<RangePattern>(pattern);
      return fmt::format(
        "{0} >= {1} && {0} {2} {3}", subject, emit_expr(r->start), r->inclusive ? "<=" : "<",
        emit_expr(r->end));
    }
    case NodeKind::VariantPattern: {
      const auto * v = cast<VariantPattern>(pattern);
      std::vector<std::string> checks{subject + "?.__tag === " + quote_js(v->name)};
      const auto & declared = ctx_.field_names(v->name);
      for (size_t i = 0; i < v->fields.size(); ++i) {
        const Pattern * sub = v->fields[i];
        if (is_catch_all(sub)) continue;
        const std::string field = i < declared.size() ? declared[i] : "value";
        checks.push_back(pattern_condition(sub, subject + "." + field));
      }
      return join(checks, " && ");
    }
    case NodeKind::ArrayPattern:
    case NodeKind::TuplePattern: {
      const auto elements = isa<ArrayPattern>(pattern) ? cast<ArrayPattern>(pattern)->elements
                                                        : cast<TuplePattern>(pattern)->elements;
      std::vector<std::string> checks{
        "Array.isArray(" + subject + ")",
        subject + ".length === " + std::to_string(elements.size())};
      for (size_t i = 0; i < elements.size(); ++i) {
        if (is_catch_all(elements[i])) continue;
        checks.push_back(pattern_condition(elements[i], subject + "[" + std::to_string(i) + "]"));
      }
      return join(checks, " && ");
    }
    default:
      break;
  }
  throw CodegenError(
    fmt::format("no JavaScript lowering for pattern '{}'", node_kind_name(pattern->get_kind())));
}

void BaseEmitter::pattern_bindings(
  const Pattern * pattern, const std::string & subject,
  std::vector<std::pair<std::string, std::string>> & out)
{
  switch (pattern->get_kind()) {
    case NodeKind::BindingPattern:
      out.emplace_back(std::string(cast<BindingPattern>(pattern)->name), subject);
      break;
    case NodeKind::VariantPattern: {
      const auto * v = cast<VariantPattern>(pattern);
      const auto & declared = ctx_.field_names(v->name);
      for (size_t i = 0; i < v->fields.size(); ++i) {
        const Pattern * sub = v->fields[i];
        std::string field;
        if (i < declared.size()) {
          field = declared[i];
        } else if (const auto * b = dyn_cast<BindingPattern>(sub)) {
          field = std::string(b->name);
        } else {
          field = "value";
        }
        pattern_bindings(sub, subject + "." + field, out);
      }
      break;
    }
    case NodeKind::ArrayPattern:
    case NodeKind::TuplePattern: {
      const auto elements = isa<ArrayPattern>(pattern) ? cast<ArrayPattern>(pattern)->elements
                                                        : cast<TuplePattern>(pattern)->elements;
      for (size_t i = 0; i < elements.size(); ++i) {
        pattern_bindings(elements[i], subject + "[" + std::to_string(i) + "]", out);
      }
      break;
    }
    default:
      break;
  }
}

std::string BaseEmitter::emit_match(const MatchExpr * node)
{
  const std::string subject = emit_expr(node->subject);
  const std::string temp = "__match";

  std::string code = "((" + temp + ") => {\n";
  ++indent_;
  bool first = true;
  for (const auto * arm : node->arms) {
    push_scope();
    std::vector<std::pair<std::string, std::string>> bindings;
    pattern_bindings(arm->pattern, temp, bindings);
    for (const auto & b : bindings) declare(b.first);

    const bool catch_all = is_catch_all(arm->pattern) && arm->guard == nullptr;
    std::string head;
    if (!catch_all) {
      std::string cond = pattern_condition(arm->pattern, temp);
      if (arm->guard != nullptr) {
        const std::string guard = emit_expr(arm->guard);
        std::string check;
        if (bindings.empty()) {
          check = "(" + guard + ")";
        } else {
          std::vector<std::string> names;
          std::vector<std::string> values;
          for (const auto & b : bindings) {
            names.push_back(b.first);
            values.push_back(b.second);
          }
          check = "((" + join(names, ", ") + ") => " + guard + ")(" + join(values, ", ") + ")";
        }
        cond = cond == "true" ? check : "(" + cond + ") && " + check;
      }
      head = std::string(first ? "if" : "else if") + " (" + cond + ")";
    } else if (!first) {
      head = "else";
    }

    // An unconditional first arm needs no branch at all.
    const bool bare = head.empty();
    if (!bare) {
      code += ind() + head + " {\n";
      ++indent_;
    }
    for (const auto & b : bindings) {
      code += ind() + "const " + b.first + " = " + b.second + ";\n";
    }
    if (arm->isBlock) {
      --indent_;
      const std::string body = emit_body(arm->body);
      ++indent_;
      if (!body.empty()) code += body + "\n";
    } else {
      code += ind() + "return " + emit_expr(arm->bodyExpr) + ";\n";
    }
    if (!bare) {
      --indent_;
      code += ind() + "}\n";
    }
    pop_scope();
    first = false;
    if (catch_all) break;
  }
  --indent_;
  code += ind() + "})(" + subject + ")";
  return code;
}

std::string BaseEmitter::emit_if_expr(const IfExpr * node)
{
  auto single = [](gsl::span<Stmt *> body) -> const Expr * {
    if (body.size() == 1 && isa<ExprStmt>(body[0])) return cast<ExprStmt>(body[0])->expr;
    return nullptr;
  };

  const Expr * then_expr = single(node->thenBody);
  const Expr * else_expr = single(node->elseBody);
  if (node->elifs.empty() && then_expr != nullptr && else_expr != nullptr) {
    return fmt::format(
      "(({}) ? ({}) : ({}))", emit_expr(node->condition), emit_expr(then_expr),
      emit_expr(else_expr));
  }

  auto branch = [this](gsl::span<Stmt *> body) {
    push_scope();
    std::string b = emit_body(body);
    pop_scope();
    return brace(b);
  };

  std::string code = "(() => {\n";
  ++indent_;
  code += ind() + "if (" + emit_expr(node->condition) + ") " + branch(node->thenBody);
  for (const auto * elif : node->elifs) {
    code += " else if (" + emit_expr(elif->condition) + ") " + branch(elif->body);
  }
  code += " else " + branch(node->elseBody);
  --indent_;
  code += "\n" + ind() + "})()";
  return code;
}

// ============================================================================
// Statements
// ============================================================================

std::string BaseEmitter::emit_stmt(const Stmt * stmt)
{
  switch (stmt->get_kind()) {
    case NodeKind::ExprStmt:
      return ind() + emit_expr(cast<ExprStmt>(stmt)->expr) + ";";
    case NodeKind::Assignment:
      return emit_assignment(cast<Assignment>(stmt));
    case NodeKind::VarDecl:
      return emit_var_decl(cast<VarDecl>(stmt));
    case NodeKind::LetDestructure:
      return emit_let_destructure(cast<LetDestructure>(stmt));
    case NodeKind::CompoundAssign:
      return emit_compound_assign(cast<CompoundAssign>(stmt));
    case NodeKind::IfStmt:
      return emit_if(cast<IfStmt>(stmt));
    case NodeKind::ForStmt:
      return emit_for(cast<ForStmt>(stmt));
    case NodeKind::WhileStmt: {
      const auto * w = cast<WhileStmt>(stmt);
      return ind() + "while (" + emit_expr(w->condition) + ") " + brace(emit_block(w->body));
    }
    case NodeKind::TryStmt:
      return emit_try(cast<TryStmt>(stmt));
    case NodeKind::ReturnStmt: {
      const auto * r = cast<ReturnStmt>(stmt);
      if (r->value == nullptr) return ind() + "return;";
      return ind() + "return " + emit_expr(r->value) + ";";
    }
    case NodeKind::BreakStmt:
      return ind() + "break;";
    case NodeKind::ContinueStmt:
      return ind() + "continue;";
    case NodeKind::GuardStmt: {
      const auto * g = cast<GuardStmt>(stmt);
      return ind() + "if (!(" + emit_expr(g->condition) + ")) " + brace(emit_block(g->elseBody));
    }
    case NodeKind::ConcurrentBlock:
      return emit_concurrent(cast<ConcurrentBlock>(stmt));
    case NodeKind::SelectStmt:
      return emit_select(cast<SelectStmt>(stmt));
    case NodeKind::FunctionDecl:
      return emit_function(cast<FunctionDecl>(stmt));
    case NodeKind::TypeDecl:
      return emit_type_decl(cast<TypeDecl>(stmt));
    case NodeKind::TypeAliasDecl:
      return {};
    case NodeKind::InterfaceDecl:
      return emit_interface(cast<InterfaceDecl>(stmt));
    case NodeKind::ImportDecl:
      return emit_import(cast<ImportDecl>(stmt));
    case NodeKind::NamedBlock: {
      const auto * block = cast<NamedBlock>(stmt);
      if (block->blockKind == BlockKind::Shared) return emit_statements(block->body);
      return emit_region_member(stmt);
    }
    case NodeKind::StateDecl:
    case NodeKind::ComputedDecl:
    case NodeKind::EffectDecl:
    case NodeKind::ComponentDecl:
    case NodeKind::StoreDecl:
    case NodeKind::RouteDecl:
    case NodeKind::MiddlewareDecl:
    case NodeKind::ConfigField:
    case NodeKind::EdgeBinding:
    case NodeKind::DeployEnvBlock:
    case NodeKind::DeployDbBlock:
    case NodeKind::SecurityAuth:
    case NodeKind::SecurityRole:
    case NodeKind::SecurityProtect:
      return emit_region_member(stmt);
    default:
      break;
  }
  throw CodegenError(
    fmt::format(
      "no JavaScript lowering for statement node '{}'", node_kind_name(stmt->get_kind())));
}

std::string BaseEmitter::emit_region_member(const Stmt * stmt)
{
  throw CodegenError(
    fmt::format("'{}' has no lowering in this output", node_kind_name(stmt->get_kind())));
}

std::string BaseEmitter::emit_assignment(const Assignment * node)
{
  if (node->targets.size() == 1 && node->values.size() == 1) {
    const Expr * target = node->targets[0];
    const std::string value = emit_expr(node->values[0]);
    if (const auto * id = dyn_cast<Identifier>(target)) {
      if (is_declared(id->name)) {
        return ind() + std::string(id->name) + " = " + value + ";";
      }
      declare(id->name);
      return ind() + "const " + std::string(id->name) + " = " + value + ";";
    }
    return ind() + emit_expr(target) + " = " + value + ";";
  }

  // a, b = 1, 2 destructures atomically.
  std::vector<std::string> values;
  for (const Expr * v : node->values) values.push_back(emit_expr(v));
  const std::string rhs = values.size() == 1 ? values[0] : "[" + join(values, ", ") + "]";

  std::vector<std::string> targets;
  bool all_declared = true;
  for (const Expr * t : node->targets) {
    if (const auto * id = dyn_cast<Identifier>(t)) {
      targets.emplace_back(id->name);
      all_declared = all_declared && is_declared(id->name);
    } else {
      targets.push_back(emit_expr(t));
    }
  }
  if (all_declared) {
    return ind() + "[" + join(targets, ", ") + "] = " + rhs + ";";
  }
  for (const Expr * t : node->targets) {
    if (const auto * id = dyn_cast<Identifier>(t)) declare(id->name);
  }
  return ind() + "const [" + join(targets, ", ") + "] = " + rhs + ";";
}

std::string BaseEmitter::emit_compound_assign(const CompoundAssign * node)
{
  return ind() + emit_expr(node->target) + " " + std::string(to_string(node->op)) + " " +
         emit_expr(node->value) + ";";
}

std::string BaseEmitter::emit_var_decl(const VarDecl * node)
{
  std::vector<std::string> lines;
  for (size_t i = 0; i < node->names.size(); ++i) {
    std::string v = "undefined";
    if (i < node->values.size()) {
      v = emit_expr(node->values[i]);
    } else if (!node->values.empty()) {
      v = emit_expr(node->values[node->values.size() - 1]);
    }
    declare(node->names[i]);
    lines.push_back(ind() + "let " + std::string(node->names[i]) + " = " + v + ";");
  }
  return join(lines, "\n");
}

std::string BaseEmitter::emit_let_destructure(const LetDestructure * node)
{
  const std::string value = emit_expr(node->value);
  std::vector<std::string> parts;
  for (size_t i = 0; i < node->names.size(); ++i) {
    declare(node->names[i]);
    if (node->isObject && node->keys[i] != node->names[i]) {
      parts.push_back(std::string(node->keys[i]) + ": " + std::string(node->names[i]));
    } else {
      parts.emplace_back(node->names[i]);
    }
  }
  if (node->isObject) {
    return ind() + "const { " + join(parts, ", ") + " } = " + value + ";";
  }
  return ind() + "const [" + join(parts, ", ") + "] = " + value + ";";
}

std::string BaseEmitter::emit_if(const IfStmt * node)
{
  std::string code =
    ind() + "if (" + emit_expr(node->condition) + ") " + brace(emit_block(node->thenBody));
  for (const auto * elif : node->elifs) {
    code += " else if (" + emit_expr(elif->condition) + ") " + brace(emit_block(elif->body));
  }
  if (node->hasElse) {
    code += " else " + brace(emit_block(node->elseBody));
  }
  return code;
}

std::string BaseEmitter::emit_for(const ForStmt * node)
{
  const std::string iter = emit_expr(node->iterable);
  const std::string vars = node->secondVar.empty()
                             ? std::string(node->variable)
                             : fmt::format("[{}, {}]", node->variable, node->secondVar);

  auto loop_body = [&](bool mark_entered) {
    ++indent_;
    push_scope();
    declare(node->variable);
    if (!node->secondVar.empty()) declare(node->secondVar);
    std::string body = emit_statements(node->body);
    if (mark_entered) body = ind() + "__entered = true;" + (body.empty() ? "" : "\n" + body);
    pop_scope();
    --indent_;
    return body;
  };

  if (!node->hasElse) {
    return ind() + "for (const " + vars + " of " + iter + ") " + brace(loop_body(false));
  }

  // for-else: the else body runs when nothing was iterated.
  const std::string temp = fmt::format("__iter_{}", ctx_.next_id());
  std::string code = ind() + "{\n";
  ++indent_;
  code += ind() + "const " + temp + " = " + iter + ";\n";
  code += ind() + "let __entered = false;\n";
  code += ind() + "for (const " + vars + " of " + temp + ") " + brace(loop_body(true)) + "\n";
  code += ind() + "if (!__entered) " + brace(emit_block(node->elseBody)) + "\n";
  --indent_;
  code += ind() + "}";
  return code;
}

std::string BaseEmitter::emit_try(const TryStmt * node)
{
  std::string code = ind() + "try " + brace(emit_block(node->body));
  if (node->hasCatch) {
    const std::string param = node->catchParam.empty() ? "__err" : std::string(node->catchParam);
    push_scope();
    declare(param);
    code += " catch (" + param + ") " + brace(emit_block(node->catchBody));
    pop_scope();
  }
  if (node->hasFinally) {
    code += " finally " + brace(emit_block(node->finallyBody));
  }
  return code;
}

// ============================================================================
// Concurrency
// ============================================================================

std::string BaseEmitter::emit_concurrent(const ConcurrentBlock * node)
{
  struct Task
  {
    std::string_view binding;  // empty for fire-and-forget
    const Expr * expr;
  };
  std::vector<Task> tasks;
  size_t last_spawn = 0;
  for (size_t i = 0; i < node->body.size(); ++i) {
    const Stmt * s = node->body[i];
    if (const auto * a = dyn_cast<Assignment>(s);
        a && a->targets.size() == 1 && a->values.size() == 1 && isa<Identifier>(a->targets[0]) &&
        isa<SpawnExpr>(a->values[0])) {
      tasks.push_back(
        {cast<Identifier>(a->targets[0])->name, cast<SpawnExpr>(a->values[0])->operand});
      last_spawn = i;
    } else if (const auto * es = dyn_cast<ExprStmt>(s); es && isa<SpawnExpr>(es->expr)) {
      tasks.push_back({{}, cast<SpawnExpr>(es->expr)->operand});
      last_spawn = i;
    }
  }

  std::vector<std::string> lines;
  auto emit_gather = [&]() {
    const std::string results = fmt::format("__results_{}", ctx_.next_id());
    std::vector<std::string> spawned;
    for (const auto & t : tasks) {
      spawned.push_back("__spawn(async () => " + emit_expr(t.expr) + ")");
    }
    const std::string list = "[" + join(spawned, ", ") + "]";

    std::string gather;
    switch (node->mode) {
      case ConcurrentMode::All:
        gather = "Promise.all(" + list + ")";
        break;
      case ConcurrentMode::CancelOnError:
        gather = "__gather_cancel_on_error(" + list + ")";
        break;
      case ConcurrentMode::First:
        gather = "__gather_first(" + list + ")";
        break;
    }
    if (node->timeout != nullptr) {
      gather = fmt::format(
        "__with_timeout({}, {}, {})", gather, emit_expr(node->timeout), tasks.size());
    }
    lines.push_back(ind() + "const " + results + " = await " + gather + ";");

    for (size_t i = 0; i < tasks.size(); ++i) {
      if (tasks[i].binding.empty()) continue;
      const std::string name(tasks[i].binding);
      if (is_declared(name)) {
        lines.push_back(fmt::format("{}{} = {}[{}];", ind(), name, results, i));
      } else {
        declare(name);
        lines.push_back(fmt::format("{}const {} = {}[{}];", ind(), name, results, i));
      }
    }
  };

  for (size_t i = 0; i < node->body.size(); ++i) {
    const Stmt * s = node->body[i];
    const bool is_spawn =
      (isa<Assignment>(s) && cast<Assignment>(s)->values.size() == 1 &&
       isa<SpawnExpr>(cast<Assignment>(s)->values[0]) && cast<Assignment>(s)->targets.size() == 1 &&
       isa<Identifier>(cast<Assignment>(s)->targets[0])) ||
      (isa<ExprStmt>(s) && isa<SpawnExpr>(cast<ExprStmt>(s)->expr));
    if (!is_spawn) {
      std::string code = emit_stmt(s);
      if (!code.empty()) lines.push_back(std::move(code));
    }
    // Results are gathered where the last task is spawned.
    if (!tasks.empty() && i == last_spawn) emit_gather();
  }
  return join(lines, "\n");
}

std::string BaseEmitter::emit_select(const SelectStmt * node)
{
  const std::string sel = fmt::format("__sel_{}", ctx_.next_id());
  std::vector<std::string> races;
  for (size_t i = 0; i < node->cases.size(); ++i) {
    const auto * c = node->cases[i];
    switch (c->caseKind) {
      case SelectCaseKind::Receive:
        races.push_back(
          fmt::format("{}.receive().then((__v) => [{}, __v])", emit_expr(c->channel), i));
        break;
      case SelectCaseKind::Send:
        races.push_back(
          fmt::format(
            "{}.send({}).then(() => [{}])", emit_expr(c->channel), emit_expr(c->value), i));
        break;
      case SelectCaseKind::Timeout:
        races.push_back(fmt::format(
          "new Promise((__r) => setTimeout(() => __r([{}]), {}))", i, emit_expr(c->value)));
        break;
      case SelectCaseKind::Default:
        races.push_back(fmt::format("Promise.resolve([{}])", i));
        break;
    }
  }

  std::string code = ind() + "const " + sel + " = await Promise.race([\n";
  for (const auto & r : races) code += ind() + "  " + r + ",\n";
  code += ind() + "]);";

  for (size_t i = 0; i < node->cases.size(); ++i) {
    const auto * c = node->cases[i];
    code += i == 0 ? "\n" + ind() + "if " : " else if ";
    code += fmt::format("({}[0] === {}) ", sel, i);
    ++indent_;
    push_scope();
    std::string body;
    if (c->caseKind == SelectCaseKind::Receive && !c->binding.empty()) {
      declare(c->binding);
      body = fmt::format("{}const {} = {}[1];", ind(), c->binding, sel);
    }
    const std::string rest = emit_statements(c->body);
    if (!rest.empty()) body += (body.empty() ? "" : "\n") + rest;
    pop_scope();
    --indent_;
    code += brace(body);
  }
  return code;
}

// ============================================================================
// Declarations
// ============================================================================

std::string BaseEmitter::emit_jsdoc(const FunctionDecl * fn)
{
  if (fn->docs.empty()) return {};
  std::string out = ind() + "/**\n";
  for (const auto line : fn->docs) {
    out += ind() + " *" + (line.empty() ? "" : " " + std::string(line)) + "\n";
  }
  for (const auto * p : fn->params) {
    if (p->type != nullptr) {
      out += fmt::format("{} * @param {{{}}} {}\n", ind(), render_type(p->type), p->name);
    }
  }
  if (fn->returnType != nullptr) {
    out += fmt::format("{} * @returns {{{}}}\n", ind(), render_type(fn->returnType));
  }
  return out + ind() + " */\n";
}

std::string BaseEmitter::emit_function(const FunctionDecl * fn, bool force_async)
{
  declare(fn->name);
  const std::string params = emit_params(fn->params);
  const bool is_async = force_async || fn->isAsync || needs_async(fn->body);

  push_scope();
  for (const auto * p : fn->params) declare(p->name);
  const bool propagate = contains_propagate(fn->body);
  if (propagate) ++indent_;
  std::string body = emit_body(fn->body);
  if (propagate) {
    --indent_;
    body = wrap_propagate(body);
  }
  pop_scope();

  return emit_jsdoc(fn) + ind() + (is_async ? "async " : "") + "function " + std::string(fn->name) +
         "(" + params + ") " + brace(body);
}

std::string BaseEmitter::emit_type_decl(const TypeDecl * node)
{
  std::vector<std::string> lines;

  if (node->is_adt()) {
    for (const auto * variant : node->variants) {
      declare(variant->name);
      const std::string tag = quote_js(variant->name);
      if (variant->fields.empty()) {
        lines.push_back(fmt::format(
          "{}const {} = Object.freeze({{ __tag: {} }});", ind(), variant->name, tag));
        continue;
      }
      std::vector<std::string> fields;
      for (const auto * f : variant->fields) fields.emplace_back(f->name);
      const std::string params = join(fields, ", ");
      lines.push_back(fmt::format(
        "{}function {}({}) {{ return Object.freeze({{ __tag: {}, {} }}); }}", ind(), variant->name,
        params, tag, params));
    }
  } else {
    declare(node->name);
    std::vector<std::string> fields;
    for (const auto * f : node->fields) fields.emplace_back(f->name);
    const std::string params = join(fields, ", ");
    lines.push_back(fmt::format(
      "{}function {}({}) {{ return {{ {} }}; }}", ind(), node->name, params, params));
  }

  std::vector<std::string> fields;
  for (const auto * f : node->fields) fields.emplace_back(f->name);

  for (const auto trait : node->derives) {
    if (node->is_adt()) {
      if (trait == "Eq") {
        lines.push_back(fmt::format(
          "{}function __eq_{}(a, b) {{ return a.__tag === b.__tag && JSON.stringify(a) === "
          "JSON.stringify(b); }}",
          ind(), node->name));
      } else if (trait == "Show") {
        lines.push_back(fmt::format(
          "{}function __show_{}(obj) {{ return obj.__tag + \"(\" + Object.entries(obj).filter(([k]) "
          "=> k !== \"__tag\").map(([k, v]) => k + \": \" + JSON.stringify(v)).join(\", \") + \")\"; "
          "}}",
          ind(), node->name));
      } else if (trait == "JSON") {
        lines.push_back(fmt::format(
          "{}function __toJSON_{}(obj) {{ return JSON.stringify(obj); }}", ind(), node->name));
      }
      continue;
    }

    if (trait == "Eq") {
      std::vector<std::string> checks;
      for (const auto & f : fields) checks.push_back("a." + f + " === b." + f);
      lines.push_back(fmt::format(
        "{}{}.__eq = function(a, b) {{ return {}; }};", ind(), node->name,
        checks.empty() ? "true" : join(checks, " && ")));
    } else if (trait == "Show") {
      std::vector<std::string> shown;
      for (const auto & f : fields) shown.push_back(f + ": ${JSON.stringify(obj." + f + ")}");
      lines.push_back(fmt::format(
        "{}{}.__show = function(obj) {{ return `{}({})`; }};", ind(), node->name, node->name,
        join(shown, ", ")));
    } else if (trait == "JSON") {
      std::vector<std::string> from;
      for (const auto & f : fields) from.push_back("d." + f);
      lines.push_back(fmt::format(
        "{}{}.toJSON = function(obj) {{ return JSON.stringify(obj); }};", ind(), node->name));
      lines.push_back(fmt::format(
        "{}{}.fromJSON = function(str) {{ const d = JSON.parse(str); return {}({}); }};", ind(),
        node->name, node->name, join(from, ", ")));
    }
  }

  return join(lines, "\n");
}

std::string BaseEmitter::emit_interface(const InterfaceDecl * node)
{
  std::string out = ind() + "/* interface " + std::string(node->name) + " {\n";
  for (const auto * m : node->members) {
    out += ind() + " *   " + std::string(m->name) + ": " + render_type(m->type) + "\n";
  }
  return out + ind() + " * } */";
}

std::string BaseEmitter::emit_import(const ImportDecl * node)
{
  std::vector<std::string> specs;
  for (size_t i = 0; i < node->names.size(); ++i) {
    declare(node->local_name(i));
    if (node->aliases[i].empty()) {
      specs.emplace_back(node->names[i]);
    } else {
      specs.push_back(std::string(node->names[i]) + " as " + std::string(node->aliases[i]));
    }
  }

  std::string clause;
  if (!node->defaultName.empty()) {
    declare(node->defaultName);
    clause = std::string(node->defaultName);
  }
  if (!specs.empty()) {
    if (!clause.empty()) clause += ", ";
    clause += "{ " + join(specs, ", ") + " }";
  }
  return ind() + "import " + clause + " from " + quote_js(node->source) + ";";
}

// ============================================================================
// JSX
// ============================================================================

void BaseEmitter::emit_jsx_attribute(
  const JsxAttribute * attr, bool /*is_component*/, std::vector<std::string> & props)
{
  const std::string value = attr->value != nullptr ? emit_expr(attr->value) : "true";
  switch (attr->attrKind) {
    case JsxAttributeKind::Plain: {
      const std::string name = attr->name == "class" ? "className" : std::string(attr->name);
      props.push_back((is_js_identifier(name) ? name : quote_js(name)) + ": " + value);
      break;
    }
    case JsxAttributeKind::Event:
      props.push_back("on" + capitalize(attr->name) + ": " + value);
      break;
    case JsxAttributeKind::Bind:
      props.push_back(std::string(attr->name) + ": " + value);
      props.push_back(fmt::format("onInput: (e) => {{ {} = e.target.{}; }}", value, attr->name));
      break;
    case JsxAttributeKind::Use:
      props.push_back(quote_js("use:" + std::string(attr->name)) + ": " + value);
      break;
    case JsxAttributeKind::Spread:
      props.push_back("..." + value);
      break;
  }
}

std::string BaseEmitter::emit_jsx_element(const JsxElement * node)
{
  const bool is_component =
    !node->tag.empty() && std::isupper(static_cast<unsigned char>(node->tag[0])) != 0;

  std::vector<std::string> props;
  for (const auto * attr : node->attributes) emit_jsx_attribute(attr, is_component, props);

  std::vector<std::string> children;
  for (const AstNode * child : node->children) children.push_back(emit_jsx_child(child));

  if (is_component) {
    if (!children.empty()) props.push_back("children: [" + join(children, ", ") + "]");
    return std::string(node->tag) + "({" + join(props, ", ") + "})";
  }

  const std::string tag = quote_js(node->tag);
  const std::string prop_obj = "{" + join(props, ", ") + "}";
  if (children.empty()) {
    return "tova_el(" + tag + ", " + prop_obj + ")";
  }
  return "tova_el(" + tag + ", " + prop_obj + ", [" + join(children, ", ") + "])";
}

std::string BaseEmitter::emit_jsx_group(gsl::span<AstNode *> children)
{
  if (children.size() == 1) return emit_jsx_child(children[0]);
  std::vector<std::string> parts;
  for (const AstNode * c : children) parts.push_back(emit_jsx_child(c));
  return "tova_fragment([" + join(parts, ", ") + "])";
}

std::string BaseEmitter::emit_jsx_child(const AstNode * child)
{
  switch (child->get_kind()) {
    case NodeKind::JsxElement:
      return emit_jsx_element(cast<JsxElement>(child));
    case NodeKind::JsxText:
      return quote_js(cast<JsxText>(child)->text);
    case NodeKind::JsxExprChild:
      return emit_expr(cast<JsxExprChild>(child)->expr);
    case NodeKind::JsxFor: {
      const auto * f = cast<JsxFor>(child);
      const std::string iter = emit_expr(f->iterable);
      const std::string vars = f->secondVar.empty()
                                 ? std::string(f->variable)
                                 : fmt::format("[{}, {}]", f->variable, f->secondVar);
      push_scope();
      declare(f->variable);
      if (!f->secondVar.empty()) declare(f->secondVar);
      const std::string body = emit_jsx_group(f->children);
      pop_scope();
      return "..." + iter + ".map((" + vars + ") => " + body + ")";
    }
    case NodeKind::JsxIf: {
      const auto * i = cast<JsxIf>(child);
      std::string out = "(" + emit_expr(i->condition) + ") ? " + emit_jsx_group(i->children);
      for (const auto * elif : i->elifs) {
        out += " : (" + emit_expr(elif->condition) + ") ? " + emit_jsx_group(elif->children);
      }
      out += " : " + (i->hasElse ? emit_jsx_group(i->elseChildren) : std::string("null"));
      return "(" + out + ")";
    }
    default:
      break;
  }
  throw CodegenError(
    fmt::format("no JavaScript lowering for JSX child '{}'", node_kind_name(child->get_kind())));
}

}  // namespace tova::codegen
