// tova/ast/ast.hpp - AST node class definitions for Tova
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "tova/ast/ast_enums.hpp"
#include "tova/basic/casting.hpp"
#include "tova/basic/source_manager.hpp"

namespace tova
{

struct Type;  // Semantic type (set by the analyzer)

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceManager.

  // Non-copyable, non-movable (managed by AstContext)
  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  /// Get the node kind
  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  /// Get the source range (byte offsets only)
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/**
 * Base class for expressions.
 */
class Expr : public AstNode
{
public:
  /// Inferred type (set by the analyzer, nullptr before analysis)
  const Type * resolvedType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for type annotations.
 */
class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for statements. Declarations are statements as well, so a
 * block body is a single `gsl::span<Stmt *>`.
 */
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for declarations.
 */
class Decl : public Stmt
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : Stmt(k, r) {}
};

/**
 * Base class for match patterns.
 */
class Pattern : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_pattern_kind(node->kind); }

protected:
  explicit Pattern(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Param;
class MatchArm;
class ElifClause;
class TypeVariant;
class TypeField;
class ObjectProperty;
class SelectCase;
class JsxAttribute;

// ============================================================================
// Expression Nodes
// ============================================================================

/// Numeric literal. `text` keeps the spelling without digit separators.
class NumberLiteral : public NodeBase<NumberLiteral, Expr, NodeKind::NumberLiteral>
{
public:
  double value;
  std::string_view text;
  bool isFloat;

  NumberLiteral(double v, std::string_view t, bool is_float, SourceRange r = {})
  : NodeBase(r), value(v), text(t), isFloat(is_float)
  {
  }
};

/// String literal without interpolation; `value` is decoded.
class StringLiteral : public NodeBase<StringLiteral, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteral(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Interpolated string. Text segments are StringLiteral parts.
class TemplateLiteral : public NodeBase<TemplateLiteral, Expr, NodeKind::TemplateLiteral>
{
public:
  gsl::span<Expr *> parts;

  explicit TemplateLiteral(SourceRange r = {}) : NodeBase(r) {}
};

class BoolLiteral : public NodeBase<BoolLiteral, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteral(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NilLiteral : public NodeBase<NilLiteral, Expr, NodeKind::NilLiteral>
{
public:
  explicit NilLiteral(SourceRange r = {}) : NodeBase(r) {}
};

/// Variable reference.
class Identifier : public NodeBase<Identifier, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit Identifier(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// `a < b <= c`: operands.size() == ops.size() + 1.
class ChainedComparison : public NodeBase<ChainedComparison, Expr, NodeKind::ChainedComparison>
{
public:
  gsl::span<Expr *> operands;
  gsl::span<BinaryOp> ops;

  explicit ChainedComparison(SourceRange r = {}) : NodeBase(r) {}
};

/// `x in xs` / `x not in xs`.
class MembershipExpr : public NodeBase<MembershipExpr, Expr, NodeKind::MembershipExpr>
{
public:
  Expr * value;
  Expr * collection;
  bool negated;

  MembershipExpr(Expr * v, Expr * c, bool neg, SourceRange r = {})
  : NodeBase(r), value(v), collection(c), negated(neg)
  {
  }
};

/// `a..b` / `a..=b`.
class RangeExpr : public NodeBase<RangeExpr, Expr, NodeKind::RangeExpr>
{
public:
  Expr * start;
  Expr * end;
  bool inclusive;

  RangeExpr(Expr * s, Expr * e, bool incl, SourceRange r = {})
  : NodeBase(r), start(s), end(e), inclusive(incl)
  {
  }
};

/// Call. Named arguments appear as NamedArgument entries in `args`.
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  explicit CallExpr(Expr * c, SourceRange r = {}) : NodeBase(r), callee(c) {}
};

/// `name: value` inside a call argument list.
class NamedArgument : public NodeBase<NamedArgument, Expr, NodeKind::NamedArgument>
{
public:
  std::string_view name;
  Expr * value;

  NamedArgument(std::string_view n, Expr * v, SourceRange r = {}) : NodeBase(r), name(n), value(v)
  {
  }
};

/// `obj.prop` or `obj?.prop`.
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::MemberExpr>
{
public:
  Expr * object;
  std::string_view property;
  bool optional;

  MemberExpr(Expr * o, std::string_view p, bool opt, SourceRange r = {})
  : NodeBase(r), object(o), property(p), optional(opt)
  {
  }
};

class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::IndexExpr>
{
public:
  Expr * object;
  Expr * index;

  IndexExpr(Expr * o, Expr * i, SourceRange r = {}) : NodeBase(r), object(o), index(i) {}
};

/// `xs[a:b:c]`; each bound may be null.
class SliceExpr : public NodeBase<SliceExpr, Expr, NodeKind::SliceExpr>
{
public:
  Expr * object;
  Expr * start = nullptr;
  Expr * end = nullptr;
  Expr * step = nullptr;

  explicit SliceExpr(Expr * o, SourceRange r = {}) : NodeBase(r), object(o) {}
};

/// Postfix `expr?`.
class PropagateExpr : public NodeBase<PropagateExpr, Expr, NodeKind::PropagateExpr>
{
public:
  Expr * operand;

  explicit PropagateExpr(Expr * e, SourceRange r = {}) : NodeBase(r), operand(e) {}
};

class AwaitExpr : public NodeBase<AwaitExpr, Expr, NodeKind::AwaitExpr>
{
public:
  Expr * operand;

  explicit AwaitExpr(Expr * e, SourceRange r = {}) : NodeBase(r), operand(e) {}
};

/// `...expr` in array literals, calls and object literals.
class SpreadExpr : public NodeBase<SpreadExpr, Expr, NodeKind::SpreadExpr>
{
public:
  Expr * operand;

  explicit SpreadExpr(Expr * e, SourceRange r = {}) : NodeBase(r), operand(e) {}
};

/**
 * `fn(a, b) expr`, `fn(a) { ... }`, `x => expr` or `(a: Int) => { ... }`.
 * Exactly one of `bodyExpr` / `body` is meaningful, selected by `isBlock`.
 */
class LambdaExpr : public NodeBase<LambdaExpr, Expr, NodeKind::LambdaExpr>
{
public:
  gsl::span<Param *> params;
  Expr * bodyExpr = nullptr;
  gsl::span<Stmt *> body;
  bool isBlock = false;
  bool isAsync = false;

  explicit LambdaExpr(SourceRange r = {}) : NodeBase(r) {}
};

class MatchExpr : public NodeBase<MatchExpr, Expr, NodeKind::MatchExpr>
{
public:
  Expr * subject;
  gsl::span<MatchArm *> arms;

  explicit MatchExpr(Expr * s, SourceRange r = {}) : NodeBase(r), subject(s) {}
};

/// `if c { a } elif d { b } else { e }` in value position.
class IfExpr : public NodeBase<IfExpr, Expr, NodeKind::IfExpr>
{
public:
  Expr * condition;
  gsl::span<Stmt *> thenBody;
  gsl::span<ElifClause *> elifs;
  gsl::span<Stmt *> elseBody;

  explicit IfExpr(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class ArrayLiteral : public NodeBase<ArrayLiteral, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteral(SourceRange r = {}) : NodeBase(r) {}
};

class ObjectLiteral : public NodeBase<ObjectLiteral, Expr, NodeKind::ObjectLiteral>
{
public:
  gsl::span<ObjectProperty *> properties;

  explicit ObjectLiteral(SourceRange r = {}) : NodeBase(r) {}
};

/// `[expr for x in xs if cond]`; `secondVar` is set for `for k, v in`.
class ListComprehension : public NodeBase<ListComprehension, Expr, NodeKind::ListComprehension>
{
public:
  Expr * element;
  std::string_view variable;
  std::string_view secondVar;
  Expr * iterable = nullptr;
  Expr * condition = nullptr;

  ListComprehension(Expr * e, std::string_view var, SourceRange r = {})
  : NodeBase(r), element(e), variable(var)
  {
  }
};

/// `{k: v for k, v in xs if cond}`.
class DictComprehension : public NodeBase<DictComprehension, Expr, NodeKind::DictComprehension>
{
public:
  Expr * key;
  Expr * value;
  std::string_view variable;
  std::string_view secondVar;
  Expr * iterable = nullptr;
  Expr * condition = nullptr;

  DictComprehension(Expr * k, Expr * v, std::string_view var, SourceRange r = {})
  : NodeBase(r), key(k), value(v), variable(var)
  {
  }
};

class TupleExpr : public NodeBase<TupleExpr, Expr, NodeKind::TupleExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit TupleExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// `lhs |> rhs`.
class PipeExpr : public NodeBase<PipeExpr, Expr, NodeKind::PipeExpr>
{
public:
  Expr * lhs;
  Expr * rhs;

  PipeExpr(Expr * l, Expr * r, SourceRange range = {}) : NodeBase(range), lhs(l), rhs(r) {}
};

/// `spawn expr` inside a concurrent block.
class SpawnExpr : public NodeBase<SpawnExpr, Expr, NodeKind::SpawnExpr>
{
public:
  Expr * operand;

  explicit SpawnExpr(Expr * e, SourceRange r = {}) : NodeBase(r), operand(e) {}
};

/**
 * JSX element. Children are JsxElement, JsxText, JsxExprChild, JsxFor or
 * JsxIf nodes.
 */
class JsxElement : public NodeBase<JsxElement, Expr, NodeKind::JsxElement>
{
public:
  std::string_view tag;
  gsl::span<JsxAttribute *> attributes;
  gsl::span<AstNode *> children;
  bool selfClosing = false;

  explicit JsxElement(std::string_view t, SourceRange r = {}) : NodeBase(r), tag(t) {}
};

// ============================================================================
// Type Nodes
// ============================================================================

/// `Int`, `Result<T, E>`.
class NamedType : public NodeBase<NamedType, TypeNode, NodeKind::NamedType>
{
public:
  std::string_view name;
  gsl::span<TypeNode *> typeArgs;

  explicit NamedType(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `[T]`.
class ArrayType : public NodeBase<ArrayType, TypeNode, NodeKind::ArrayType>
{
public:
  TypeNode * elementType;

  explicit ArrayType(TypeNode * elem, SourceRange r = {}) : NodeBase(r), elementType(elem) {}
};

/// `(A, B)`.
class TupleType : public NodeBase<TupleType, TypeNode, NodeKind::TupleType>
{
public:
  gsl::span<TypeNode *> elements;

  explicit TupleType(SourceRange r = {}) : NodeBase(r) {}
};

/// `fn(A, B) -> R`.
class FunctionType : public NodeBase<FunctionType, TypeNode, NodeKind::FunctionType>
{
public:
  gsl::span<TypeNode *> params;
  TypeNode * returnType = nullptr;

  explicit FunctionType(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/**
 * Immutable binding or reassignment: `x = e`, `x: Int = e`, `a, b = 1, 2`,
 * `obj.f = e`. Targets are Identifier, MemberExpr or IndexExpr nodes.
 */
class Assignment : public NodeBase<Assignment, Stmt, NodeKind::Assignment>
{
public:
  gsl::span<Expr *> targets;
  gsl::span<Expr *> values;
  TypeNode * type = nullptr;

  explicit Assignment(SourceRange r = {}) : NodeBase(r) {}
};

/// Mutable binding: `var x = e`, `var a, b = 1, 2`.
class VarDecl : public NodeBase<VarDecl, Stmt, NodeKind::VarDecl>
{
public:
  gsl::span<std::string_view> names;
  gsl::span<Expr *> values;
  TypeNode * type = nullptr;

  explicit VarDecl(SourceRange r = {}) : NodeBase(r) {}
};

/**
 * `let {a, b: c} = o` or `let [x, y] = xs`. For object patterns `keys[i]`
 * is the source property of `names[i]`.
 */
class LetDestructure : public NodeBase<LetDestructure, Stmt, NodeKind::LetDestructure>
{
public:
  bool isObject;
  gsl::span<std::string_view> keys;
  gsl::span<std::string_view> names;
  Expr * value = nullptr;

  explicit LetDestructure(bool is_object, SourceRange r = {}) : NodeBase(r), isObject(is_object) {}
};

class CompoundAssign : public NodeBase<CompoundAssign, Stmt, NodeKind::CompoundAssign>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;

  CompoundAssign(Expr * t, AssignOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

/// `if c { } elif d { } else { }`; `else if` parses as an elif.
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  gsl::span<Stmt *> thenBody;
  gsl::span<ElifClause *> elifs;
  gsl::span<Stmt *> elseBody;
  bool hasElse = false;

  explicit IfStmt(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

/// `for x in xs { } else { }`; the else body runs when nothing was iterated.
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  std::string_view variable;
  std::string_view secondVar;
  Expr * iterable;
  gsl::span<Stmt *> body;
  gsl::span<Stmt *> elseBody;
  bool hasElse = false;

  ForStmt(std::string_view var, Expr * iter, SourceRange r = {})
  : NodeBase(r), variable(var), iterable(iter)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * condition;
  gsl::span<Stmt *> body;

  explicit WhileStmt(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class TryStmt : public NodeBase<TryStmt, Stmt, NodeKind::TryStmt>
{
public:
  gsl::span<Stmt *> body;
  std::string_view catchParam;
  gsl::span<Stmt *> catchBody;
  gsl::span<Stmt *> finallyBody;
  bool hasCatch = false;
  bool hasFinally = false;

  explicit TryStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value;

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::BreakStmt>
{
public:
  explicit BreakStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::ContinueStmt>
{
public:
  explicit ContinueStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `guard cond else { ... }`.
class GuardStmt : public NodeBase<GuardStmt, Stmt, NodeKind::GuardStmt>
{
public:
  Expr * condition;
  gsl::span<Stmt *> elseBody;

  explicit GuardStmt(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

/// `concurrent [mode] [timeout(ms)] { ... }`.
class ConcurrentBlock : public NodeBase<ConcurrentBlock, Stmt, NodeKind::ConcurrentBlock>
{
public:
  ConcurrentMode mode;
  Expr * timeout = nullptr;
  gsl::span<Stmt *> body;

  explicit ConcurrentBlock(ConcurrentMode m, SourceRange r = {}) : NodeBase(r), mode(m) {}
};

class SelectStmt : public NodeBase<SelectStmt, Stmt, NodeKind::SelectStmt>
{
public:
  gsl::span<SelectCase *> cases;

  explicit SelectStmt(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view name;
  gsl::span<std::string_view> typeParams;
  gsl::span<Param *> params;
  TypeNode * returnType = nullptr;
  gsl::span<Stmt *> body;
  gsl::span<std::string_view> docs;
  bool isAsync = false;
  bool isPub = false;

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/**
 * `type Name<T> { Variant(f: T) ... }` (ADT) or `type Name { f: T ... }`
 * (record), with an optional `derive [...]` list.
 */
class TypeDecl : public NodeBase<TypeDecl, Decl, NodeKind::TypeDecl>
{
public:
  std::string_view name;
  gsl::span<std::string_view> typeParams;
  gsl::span<TypeVariant *> variants;
  gsl::span<TypeField *> fields;
  gsl::span<std::string_view> derives;
  bool isPub = false;

  explicit TypeDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  [[nodiscard]] bool is_adt() const noexcept { return !variants.empty(); }
};

class TypeAliasDecl : public NodeBase<TypeAliasDecl, Decl, NodeKind::TypeAliasDecl>
{
public:
  std::string_view name;
  gsl::span<std::string_view> typeParams;
  TypeNode * aliasedType;

  TypeAliasDecl(std::string_view n, TypeNode * t, SourceRange r = {})
  : NodeBase(r), name(n), aliasedType(t)
  {
  }
};

/// `interface Name { method: fn(A) -> R ... }`; members are TypeFields.
class InterfaceDecl : public NodeBase<InterfaceDecl, Decl, NodeKind::InterfaceDecl>
{
public:
  std::string_view name;
  gsl::span<TypeField *> members;

  explicit InterfaceDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `import { a, b as c } from "m"` or `import X from "m"`.
class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::ImportDecl>
{
public:
  std::string_view source;
  std::string_view defaultName;
  gsl::span<std::string_view> names;
  gsl::span<std::string_view> aliases;  ///< same length as names; empty entry means no alias

  explicit ImportDecl(std::string_view src, SourceRange r = {}) : NodeBase(r), source(src) {}

  [[nodiscard]] std::string_view local_name(size_t i) const noexcept
  {
    return aliases[i].empty() ? names[i] : aliases[i];
  }
};

/// Top-level region: `client { }`, `server "api" { }`, `edge { }`, ...
class NamedBlock : public NodeBase<NamedBlock, Decl, NodeKind::NamedBlock>
{
public:
  BlockKind blockKind;
  std::string_view name;  ///< empty when unnamed
  gsl::span<Stmt *> body;

  explicit NamedBlock(BlockKind k, SourceRange r = {}) : NodeBase(r), blockKind(k) {}
};

/// `state count: Int = 0` (client).
class StateDecl : public NodeBase<StateDecl, Decl, NodeKind::StateDecl>
{
public:
  std::string_view name;
  TypeNode * type = nullptr;
  Expr * init;

  StateDecl(std::string_view n, Expr * i, SourceRange r = {}) : NodeBase(r), name(n), init(i) {}
};

/// `computed total = expr` (client).
class ComputedDecl : public NodeBase<ComputedDecl, Decl, NodeKind::ComputedDecl>
{
public:
  std::string_view name;
  Expr * expr;

  ComputedDecl(std::string_view n, Expr * e, SourceRange r = {}) : NodeBase(r), name(n), expr(e) {}
};

/// `effect { ... }` (client).
class EffectDecl : public NodeBase<EffectDecl, Decl, NodeKind::EffectDecl>
{
public:
  gsl::span<Stmt *> body;

  explicit EffectDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// `component Name(props) { ... }` with an optional scoped style block.
class ComponentDecl : public NodeBase<ComponentDecl, Decl, NodeKind::ComponentDecl>
{
public:
  std::string_view name;
  gsl::span<Param *> params;
  gsl::span<Stmt *> body;
  std::string_view style;  ///< raw CSS body, empty when absent

  explicit ComponentDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `store Name { state ...; computed ...; fn ... }`.
class StoreDecl : public NodeBase<StoreDecl, Decl, NodeKind::StoreDecl>
{
public:
  std::string_view name;
  gsl::span<Stmt *> body;

  explicit StoreDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `route GET "/path" => handler`.
class RouteDecl : public NodeBase<RouteDecl, Decl, NodeKind::RouteDecl>
{
public:
  std::string_view method;
  std::string_view path;
  Expr * handler;

  RouteDecl(std::string_view m, std::string_view p, Expr * h, SourceRange r = {})
  : NodeBase(r), method(m), path(p), handler(h)
  {
  }
};

/// `middleware fn name(req, next) { ... }`.
class MiddlewareDecl : public NodeBase<MiddlewareDecl, Decl, NodeKind::MiddlewareDecl>
{
public:
  FunctionDecl * function;

  explicit MiddlewareDecl(FunctionDecl * fn, SourceRange r = {}) : NodeBase(r), function(fn) {}
};

/// `key: expr` inside edge/deploy/cli/security blocks.
class ConfigField : public NodeBase<ConfigField, Decl, NodeKind::ConfigField>
{
public:
  std::string_view key;
  Expr * value;

  ConfigField(std::string_view k, Expr * v, SourceRange r = {}) : NodeBase(r), key(k), value(v) {}
};

/// `kv CACHE`, `env API_URL = "..."`, `secret TOKEN` inside an edge block.
class EdgeBinding : public NodeBase<EdgeBinding, Decl, NodeKind::EdgeBinding>
{
public:
  EdgeBindingKind bindingKind;
  std::string_view name;
  Expr * defaultValue = nullptr;

  EdgeBinding(EdgeBindingKind k, std::string_view n, SourceRange r = {})
  : NodeBase(r), bindingKind(k), name(n)
  {
  }
};

/// `env { KEY: value }` inside a deploy block.
class DeployEnvBlock : public NodeBase<DeployEnvBlock, Decl, NodeKind::DeployEnvBlock>
{
public:
  gsl::span<ConfigField *> entries;

  explicit DeployEnvBlock(SourceRange r = {}) : NodeBase(r) {}
};

/// `db { postgres { k: v } }` inside a deploy block.
class DeployDbBlock : public NodeBase<DeployDbBlock, Decl, NodeKind::DeployDbBlock>
{
public:
  std::string_view engine;
  gsl::span<ConfigField *> entries;

  explicit DeployDbBlock(std::string_view e, SourceRange r = {}) : NodeBase(r), engine(e) {}
};

/// `auth jwt { secret: env("JWT_SECRET") }`.
class SecurityAuth : public NodeBase<SecurityAuth, Decl, NodeKind::SecurityAuth>
{
public:
  std::string_view authKind;
  gsl::span<ConfigField *> entries;

  explicit SecurityAuth(std::string_view k, SourceRange r = {}) : NodeBase(r), authKind(k) {}
};

/// `role Admin { can: [manage_users, view] }`.
class SecurityRole : public NodeBase<SecurityRole, Decl, NodeKind::SecurityRole>
{
public:
  std::string_view name;
  gsl::span<std::string_view> permissions;

  explicit SecurityRole(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `protect "/admin/*" { require: Admin }`.
class SecurityProtect : public NodeBase<SecurityProtect, Decl, NodeKind::SecurityProtect>
{
public:
  std::string_view path;
  std::string_view require;
  gsl::span<ConfigField *> entries;  ///< other keys (e.g. rate_limit)

  explicit SecurityProtect(std::string_view p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

// ============================================================================
// Pattern Nodes
// ============================================================================

class WildcardPattern : public NodeBase<WildcardPattern, Pattern, NodeKind::WildcardPattern>
{
public:
  explicit WildcardPattern(SourceRange r = {}) : NodeBase(r) {}
};

/// Lowercase identifier that binds the matched value.
class BindingPattern : public NodeBase<BindingPattern, Pattern, NodeKind::BindingPattern>
{
public:
  std::string_view name;

  explicit BindingPattern(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Number, string, bool or nil literal (numbers may be negated).
class LiteralPattern : public NodeBase<LiteralPattern, Pattern, NodeKind::LiteralPattern>
{
public:
  Expr * literal;

  explicit LiteralPattern(Expr * lit, SourceRange r = {}) : NodeBase(r), literal(lit) {}
};

class RangePattern : public NodeBase<RangePattern, Pattern, NodeKind::RangePattern>
{
public:
  Expr * start;
  Expr * end;
  bool inclusive;

  RangePattern(Expr * s, Expr * e, bool incl, SourceRange r = {})
  : NodeBase(r), start(s), end(e), inclusive(incl)
  {
  }
};

/// `Circle(r)`, `Some(_)`, `None`.
class VariantPattern : public NodeBase<VariantPattern, Pattern, NodeKind::VariantPattern>
{
public:
  std::string_view name;
  gsl::span<Pattern *> fields;

  explicit VariantPattern(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class ArrayPattern : public NodeBase<ArrayPattern, Pattern, NodeKind::ArrayPattern>
{
public:
  gsl::span<Pattern *> elements;

  explicit ArrayPattern(SourceRange r = {}) : NodeBase(r) {}
};

class TuplePattern : public NodeBase<TuplePattern, Pattern, NodeKind::TuplePattern>
{
public:
  gsl::span<Pattern *> elements;

  explicit TuplePattern(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// Function, lambda or component parameter.
class Param : public NodeBase<Param, AstNode, NodeKind::Param>
{
public:
  std::string_view name;
  TypeNode * type = nullptr;
  Expr * defaultValue = nullptr;

  explicit Param(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `pattern [if guard] => expr | { ... }`.
class MatchArm : public NodeBase<MatchArm, AstNode, NodeKind::MatchArm>
{
public:
  Pattern * pattern;
  Expr * guard = nullptr;
  Expr * bodyExpr = nullptr;
  gsl::span<Stmt *> body;
  bool isBlock = false;

  explicit MatchArm(Pattern * p, SourceRange r = {}) : NodeBase(r), pattern(p) {}
};

class ElifClause : public NodeBase<ElifClause, AstNode, NodeKind::ElifClause>
{
public:
  Expr * condition;
  gsl::span<Stmt *> body;

  explicit ElifClause(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

class TypeVariant : public NodeBase<TypeVariant, AstNode, NodeKind::TypeVariant>
{
public:
  std::string_view name;
  gsl::span<TypeField *> fields;

  explicit TypeVariant(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `name: Type` (type may be null inside variants: `Some(value)`).
class TypeField : public NodeBase<TypeField, AstNode, NodeKind::TypeField>
{
public:
  std::string_view name;
  TypeNode * type;

  TypeField(std::string_view n, TypeNode * t, SourceRange r = {}) : NodeBase(r), name(n), type(t)
  {
  }
};

/// `key: value`, shorthand `key`, or `...spread` (key empty, value SpreadExpr).
class ObjectProperty : public NodeBase<ObjectProperty, AstNode, NodeKind::ObjectProperty>
{
public:
  std::string_view key;
  Expr * value;
  bool shorthand = false;

  ObjectProperty(std::string_view k, Expr * v, SourceRange r = {}) : NodeBase(r), key(k), value(v)
  {
  }
};

/// One arm of a select statement.
class SelectCase : public NodeBase<SelectCase, AstNode, NodeKind::SelectCase>
{
public:
  SelectCaseKind caseKind;
  std::string_view binding;  ///< Receive: bound name
  Expr * channel = nullptr;  ///< Receive/Send
  Expr * value = nullptr;    ///< Send: payload, Timeout: milliseconds
  gsl::span<Stmt *> body;

  explicit SelectCase(SelectCaseKind k, SourceRange r = {}) : NodeBase(r), caseKind(k) {}
};

class JsxAttribute : public NodeBase<JsxAttribute, AstNode, NodeKind::JsxAttribute>
{
public:
  JsxAttributeKind attrKind;
  std::string_view name;   ///< attribute, event, bound prop or action name
  Expr * value = nullptr;  ///< null for bare boolean attributes / `use:x`

  JsxAttribute(JsxAttributeKind k, std::string_view n, SourceRange r = {})
  : NodeBase(r), attrKind(k), name(n)
  {
  }
};

class JsxText : public NodeBase<JsxText, AstNode, NodeKind::JsxText>
{
public:
  std::string_view text;

  explicit JsxText(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

/// `{expr}` child.
class JsxExprChild : public NodeBase<JsxExprChild, AstNode, NodeKind::JsxExprChild>
{
public:
  Expr * expr;

  explicit JsxExprChild(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// `for item in items key={item.id} { ... }` child.
class JsxFor : public NodeBase<JsxFor, AstNode, NodeKind::JsxFor>
{
public:
  std::string_view variable;
  std::string_view secondVar;
  Expr * iterable;
  Expr * key = nullptr;
  gsl::span<AstNode *> children;

  JsxFor(std::string_view var, Expr * iter, SourceRange r = {})
  : NodeBase(r), variable(var), iterable(iter)
  {
  }
};

/**
 * `if c { ... } elif d { ... } else { ... }` child. Elif branches are
 * JsxIf nodes without their own elifs or else.
 */
class JsxIf : public NodeBase<JsxIf, AstNode, NodeKind::JsxIf>
{
public:
  Expr * condition;
  gsl::span<AstNode *> children;
  gsl::span<JsxIf *> elifs;
  gsl::span<AstNode *> elseChildren;
  bool hasElse = false;

  explicit JsxIf(Expr * c, SourceRange r = {}) : NodeBase(r), condition(c) {}
};

// ============================================================================
// Program (Root Node)
// ============================================================================

/// Program (root AST node): top-level statements in source order.
class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> body;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Get the SourceRange from any AST node.
 */
[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace tova
