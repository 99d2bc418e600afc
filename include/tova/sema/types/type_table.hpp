// tova/sema/types/type_table.hpp - Type namespace symbol table
//
// Manages user type declarations (records, ADTs, aliases) by name.
//
#pragma once

#include <string_view>
#include <unordered_map>
#include <vector>

#include "tova/ast/ast.hpp"
#include "tova/sema/types/type.hpp"

namespace tova
{

// ============================================================================
// Type Symbol
// ============================================================================

/**
 * A symbol in the Type namespace.
 */
struct TypeSymbol
{
  std::string_view name;
  const Type * type = nullptr;
  const AstNode * decl = nullptr;  ///< TypeDecl, TypeAliasDecl or InterfaceDecl

  [[nodiscard]] bool is_type_alias() const noexcept
  {
    return decl && decl->get_kind() == NodeKind::TypeAliasDecl;
  }

  [[nodiscard]] bool is_interface() const noexcept
  {
    return decl && decl->get_kind() == NodeKind::InterfaceDecl;
  }
};

// ============================================================================
// Type Table
// ============================================================================

/// Transparent hash functor for string_view heterogeneous lookup
struct TypeTableHash
{
  using is_transparent = void;
  size_t operator()(std::string_view sv) const noexcept
  {
    return std::hash<std::string_view>{}(sv);
  }
};

/// Transparent equality functor for string_view heterogeneous lookup
struct TypeTableEqual
{
  using is_transparent = void;
  bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/**
 * Type namespace symbol table.
 *
 * Built-in primitive names are resolved by TypeContext::lookup_builtin and
 * are not stored here. Names are interned views owned by the AstContext.
 */
class TypeTable
{
public:
  TypeTable() = default;

  /**
   * Define a type symbol.
   *
   * @return true if defined successfully, false if name already exists
   */
  bool define(TypeSymbol symbol)
  {
    auto [it, inserted] = symbols_.emplace(symbol.name, symbol);
    if (inserted) order_.push_back(symbol.name);
    return inserted;
  }

  /// Replace the resolved type of an existing symbol (aliases resolve late).
  void set_type(std::string_view name, const Type * type)
  {
    auto it = symbols_.find(name);
    if (it != symbols_.end()) it->second.type = type;
  }

  [[nodiscard]] const TypeSymbol * lookup(std::string_view name) const
  {
    auto it = symbols_.find(name);
    return it != symbols_.end() ? &it->second : nullptr;
  }

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name) != nullptr; }

  [[nodiscard]] size_t size() const noexcept { return symbols_.size(); }

  /// ADT types in declaration order.
  [[nodiscard]] std::vector<const Type *> adt_types() const
  {
    std::vector<const Type *> out;
    for (auto name : order_) {
      const auto & sym = symbols_.at(name);
      if (sym.type && sym.type->kind == TypeKind::Adt) out.push_back(sym.type);
    }
    return out;
  }

private:
  std::unordered_map<std::string_view, TypeSymbol, TypeTableHash, TypeTableEqual> symbols_;
  std::vector<std::string_view> order_;
};

}  // namespace tova
