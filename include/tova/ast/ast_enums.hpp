// tova/ast/ast_enums.hpp - AST enumeration definitions
//
// This header contains all enumeration types used in the Tova AST,
// including node kinds, operators, and region/block tags.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace tova
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for efficient range-based classof checks.
 * Auto-generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "tova/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "tova/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "tova/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "tova/ast/ast_nodes.def"

// === Patterns ===
#define AST_NODE_PATTERN(Class, Kind, Snake) Kind,
#include "tova/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "tova/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "tova/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators. Keyword and symbolic spellings (`and`/`&&`,
 * `or`/`||`) map to the same tag.
 */
enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Pow,  ///< **
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Logical
  And,       ///< and, &&
  Or,        ///< or, ||
  Coalesce,  ///< ??
};

/// Unary operators (`not` and `!` are both Not).
enum class UnaryOp : uint8_t {
  Not,
  Neg,
};

/// Compound assignment operators.
enum class AssignOp : uint8_t {
  AddAssign,  ///< +=
  SubAssign,  ///< -=
  MulAssign,  ///< *=
  DivAssign,  ///< /=
};

// ============================================================================
// Region and Block Tags
// ============================================================================

/// Top-level named region kinds.
enum class BlockKind : uint8_t {
  Shared,
  Client,
  Server,
  Edge,
  Deploy,
  Cli,
  Security,
};

/// Result aggregation of a `concurrent` block.
enum class ConcurrentMode : uint8_t {
  All,
  CancelOnError,
  First,
};

enum class SelectCaseKind : uint8_t {
  Receive,  ///< name from channel
  Send,     ///< channel.send(v)
  Timeout,  ///< timeout(ms)
  Default,  ///< _
};

enum class JsxAttributeKind : uint8_t {
  Plain,   ///< name="v" / name={e} / name
  Event,   ///< on:event={h}
  Bind,    ///< bind:prop={x}
  Use,     ///< use:action[={e}]
  Spread,  ///< {...e}
};

/// Binding kinds declared in an edge block.
enum class EdgeBindingKind : uint8_t {
  Kv,
  Sql,
  Storage,
  Queue,
  Env,
  Secret,
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Pow:
      return "**";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "and";
    case BinaryOp::Or:
      return "or";
    case BinaryOp::Coalesce:
      return "??";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "not";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BlockKind kind) noexcept
{
  switch (kind) {
    case BlockKind::Shared:
      return "shared";
    case BlockKind::Client:
      return "client";
    case BlockKind::Server:
      return "server";
    case BlockKind::Edge:
      return "edge";
    case BlockKind::Deploy:
      return "deploy";
    case BlockKind::Cli:
      return "cli";
    case BlockKind::Security:
      return "security";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(ConcurrentMode mode) noexcept
{
  switch (mode) {
    case ConcurrentMode::All:
      return "all";
    case ConcurrentMode::CancelOnError:
      return "cancel_on_error";
    case ConcurrentMode::First:
      return "first";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(SelectCaseKind kind) noexcept
{
  switch (kind) {
    case SelectCaseKind::Receive:
      return "receive";
    case SelectCaseKind::Send:
      return "send";
    case SelectCaseKind::Timeout:
      return "timeout";
    case SelectCaseKind::Default:
      return "default";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(JsxAttributeKind kind) noexcept
{
  switch (kind) {
    case JsxAttributeKind::Plain:
      return "plain";
    case JsxAttributeKind::Event:
      return "event";
    case JsxAttributeKind::Bind:
      return "bind";
    case JsxAttributeKind::Use:
      return "use";
    case JsxAttributeKind::Spread:
      return "spread";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(EdgeBindingKind kind) noexcept
{
  switch (kind) {
    case EdgeBindingKind::Kv:
      return "kv";
    case EdgeBindingKind::Sql:
      return "sql";
    case EdgeBindingKind::Storage:
      return "storage";
    case EdgeBindingKind::Queue:
      return "queue";
    case EdgeBindingKind::Env:
      return "env";
    case EdgeBindingKind::Secret:
      return "secret";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

/// First expression node kind
inline constexpr NodeKind k_first_expr_kind = NodeKind::NumberLiteral;
/// Last expression node kind
inline constexpr NodeKind k_last_expr_kind = NodeKind::JsxElement;

/// First type node kind
inline constexpr NodeKind k_first_type_kind = NodeKind::NamedType;
/// Last type node kind
inline constexpr NodeKind k_last_type_kind = NodeKind::FunctionType;

/// First statement node kind
inline constexpr NodeKind k_first_stmt_kind = NodeKind::ExprStmt;
/// Last statement node kind
inline constexpr NodeKind k_last_stmt_kind = NodeKind::SelectStmt;

/// First declaration node kind
inline constexpr NodeKind k_first_decl_kind = NodeKind::FunctionDecl;
/// Last declaration node kind
inline constexpr NodeKind k_last_decl_kind = NodeKind::SecurityProtect;

/// First pattern node kind
inline constexpr NodeKind k_first_pattern_kind = NodeKind::WildcardPattern;
/// Last pattern node kind
inline constexpr NodeKind k_last_pattern_kind = NodeKind::TuplePattern;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a type
[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

/// Check if a NodeKind is a statement (declarations are statements too)
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_decl_kind;
}

/// Check if a NodeKind is a declaration
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

/// Check if a NodeKind is a match pattern
[[nodiscard]] constexpr bool is_pattern_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_pattern_kind && kind <= detail::k_last_pattern_kind;
}

}  // namespace tova
