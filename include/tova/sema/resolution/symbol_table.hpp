// tova/sema/resolution/symbol_table.hpp - Scope and symbol management
//
// This header provides symbol and scope management for semantic analysis.
// Scopes are owned by the analyzer stack frame that opens them.
//
#pragma once

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tova/ast/ast.hpp"
#include "tova/sema/types/type.hpp"

namespace tova
{

// ============================================================================
// Symbol Types
// ============================================================================

/**
 * Kind of symbol in a scope.
 */
enum class SymbolKind : uint8_t {
  Variable,   ///< `x = e` or `var x = e`
  Parameter,  ///< function, lambda or component parameter
  Function,   ///< `fn name() {}`
  Type,       ///< type, alias or interface name
  Variant,    ///< ADT variant constructor
  State,      ///< client `state`
  Computed,   ///< client `computed`
  Component,  ///< client `component`
  Store,      ///< client `store`
  Import,     ///< imported name
  Builtin,    ///< stdlib, runtime or implicit region binding
};

[[nodiscard]] std::string_view to_string(SymbolKind kind) noexcept;

/**
 * A symbol in a scope.
 */
struct Symbol
{
  std::string_view name;
  SymbolKind kind = SymbolKind::Variable;
  const Type * type = nullptr;  ///< Declared or inferred type, nullptr when unknown
  bool isMutable = false;
  SourceRange definitionRange;  ///< Location of the definition (byte offsets)

  // Function signature (Function / Variant)
  std::vector<std::string_view> paramNames;
  std::vector<const Type *> paramTypes;  ///< nullptr for unannotated parameters
  std::vector<std::string_view> typeParams;
  size_t requiredParams = 0;
  size_t totalParams = 0;
  bool hasSignature = false;

  bool used = false;

  /// Link back to AST node
  const AstNode * astNode = nullptr;

  [[nodiscard]] bool is_callable() const noexcept
  {
    return kind == SymbolKind::Function || kind == SymbolKind::Variant;
  }

  /// Reactive binding whose reads are tracked by the client runtime
  [[nodiscard]] bool is_tracked() const noexcept
  {
    return kind == SymbolKind::State || kind == SymbolKind::Computed;
  }
};

// ============================================================================
// Scope Context
// ============================================================================

enum class ScopeContext : uint8_t {
  Module,
  Server,
  Client,
  Shared,
  Edge,
  Function,
  Block,
};

[[nodiscard]] std::string_view to_string(ScopeContext ctx) noexcept;

// ============================================================================
// Transparent Hash/Equal for string_view keys
// ============================================================================

/// Transparent hash functor for string_view heterogeneous lookup
struct StringViewHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct StringViewEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

// ============================================================================
// Scope
// ============================================================================

/**
 * A lexical scope containing symbol definitions.
 *
 * Scopes form a parent chain; child scopes look up symbols in parent
 * scopes. Symbol names (keys) must be interned string_views owned by the
 * AstContext.
 */
class Scope
{
public:
  explicit Scope(ScopeContext context, Scope * parent = nullptr)
  : parent_(parent), context_(context)
  {
  }

  Scope(const Scope &) = delete;
  Scope & operator=(const Scope &) = delete;

  // ===========================================================================
  // Symbol Definition
  // ===========================================================================

  /**
   * Define a symbol in this scope.
   *
   * @return the stored symbol, or nullptr if the name already exists
   */
  Symbol * define(Symbol symbol)
  {
    auto [it, inserted] = symbols_.emplace(symbol.name, std::move(symbol));
    if (!inserted) return nullptr;
    order_.push_back(it->first);
    return &it->second;
  }

  /// Insert or overwrite a symbol in this scope.
  void upsert(Symbol symbol)
  {
    const auto name = symbol.name;
    auto [it, inserted] = symbols_.insert_or_assign(name, std::move(symbol));
    if (inserted) order_.push_back(name);
  }

  // ===========================================================================
  // Symbol Lookup
  // ===========================================================================

  [[nodiscard]] Symbol * lookup_local(std::string_view name)
  {
    auto it = symbols_.find(name);
    return it != symbols_.end() ? &it->second : nullptr;
  }

  [[nodiscard]] Symbol * lookup(std::string_view name)
  {
    if (Symbol * sym = lookup_local(name)) {
      return sym;
    }
    return parent_ ? parent_->lookup(name) : nullptr;
  }

  /**
   * Look up `name` from this scope up to and including the nearest
   * boundary scope (anything that is not a plain block).
   */
  [[nodiscard]] Symbol * lookup_to_boundary(std::string_view name);

  /// True when `name` is bound somewhere beyond the nearest boundary scope.
  [[nodiscard]] bool defined_beyond_boundary(std::string_view name);

  /// Names visible from this scope (innermost first, may repeat).
  [[nodiscard]] std::vector<std::string_view> visible_names() const;

  // ===========================================================================
  // Scope Properties
  // ===========================================================================

  [[nodiscard]] Scope * get_parent() const noexcept { return parent_; }
  [[nodiscard]] ScopeContext get_context() const noexcept { return context_; }

  /// Nearest enclosing region context (module, server, client, shared, edge)
  [[nodiscard]] ScopeContext region_context() const noexcept;

  [[nodiscard]] bool is_boundary() const noexcept { return context_ != ScopeContext::Block; }

  [[nodiscard]] bool is_loop() const noexcept { return loop_; }
  void set_loop(bool loop) noexcept { loop_ = loop; }

  /// Symbols in definition order
  [[nodiscard]] const std::vector<std::string_view> & names() const noexcept { return order_; }

  [[nodiscard]] bool contains(std::string_view name) const { return symbols_.count(name) != 0; }
  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }
  [[nodiscard]] bool empty() const noexcept { return symbols_.empty(); }

private:
  Scope * parent_;
  ScopeContext context_;
  bool loop_ = false;
  std::unordered_map<std::string_view, Symbol, StringViewHash, StringViewEqual> symbols_;
  std::vector<std::string_view> order_;
};

}  // namespace tova
