// tova/sema/types/type.hpp - Semantic type representation
//
// Represents resolved types for semantic analysis. Types are owned and
// interned by a TypeContext; everything else holds `const Type *`.
//
#pragma once

#include <cstdint>
#include <deque>
#include <gsl/span>
#include <memory_resource>
#include <string_view>
#include <vector>

namespace tova
{

class AstNode;

// ============================================================================
// Type Kind
// ============================================================================

enum class TypeKind : uint8_t {
  // Primitive types
  Int,
  Float,
  String,
  Bool,
  Nil,

  // Gradual typing
  Any,      ///< explicitly dynamic
  Unknown,  ///< no annotation / not inferable

  // Structural types
  Array,     ///< [T]
  Tuple,     ///< (A, B)
  Function,  ///< fn(A) -> R

  // Nominal types
  Record,        ///< type Name { field: T }
  Adt,           ///< type Name { A(x: T), B }
  Generic,       ///< Name<Args> without a resolved declaration (Result, Option, ...)
  TypeVariable,  ///< T inside a generic declaration
  Union,         ///< A | B
};

struct Type;

/// One variant of an algebraic data type.
struct VariantInfo
{
  std::string_view name;
  gsl::span<const std::string_view> fieldNames;
  gsl::span<const Type * const> fieldTypes;  ///< nullptr entries for unannotated fields
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type representation.
 *
 * Unlike the AST TypeNode (syntactic representation), Type is the resolved
 * semantic type after name resolution.
 */
struct Type
{
  TypeKind kind;

  /// Record / Adt / Generic / TypeVariable name
  std::string_view name;

  /// Array: element type
  const Type * element_type = nullptr;

  /// Function: return type
  const Type * return_type = nullptr;

  /// Tuple elements, Function parameters, Union members, Generic arguments,
  /// Record field types
  gsl::span<const Type * const> elements;

  /// Record field names (parallel to `elements`)
  gsl::span<const std::string_view> field_names;

  /// Adt / Generic declaration parameters
  gsl::span<const std::string_view> type_params;

  /// Adt variants
  gsl::span<const VariantInfo> variants;

  /// Declaring AST node for nominal types
  const AstNode * decl = nullptr;

  // ===========================================================================
  // Type Queries
  // ===========================================================================

  [[nodiscard]] bool is_numeric() const noexcept
  {
    return kind == TypeKind::Int || kind == TypeKind::Float;
  }

  [[nodiscard]] bool is_primitive() const noexcept
  {
    return kind == TypeKind::Int || kind == TypeKind::Float || kind == TypeKind::String ||
           kind == TypeKind::Bool || kind == TypeKind::Nil;
  }

  /// Any or Unknown: compatible with everything in both directions
  [[nodiscard]] bool is_dynamic() const noexcept
  {
    return kind == TypeKind::Any || kind == TypeKind::Unknown;
  }

  /// True when nothing useful is known statically
  [[nodiscard]] bool is_opaque() const noexcept
  {
    return is_dynamic() || kind == TypeKind::TypeVariable;
  }

  [[nodiscard]] bool is_nominal() const noexcept
  {
    return kind == TypeKind::Record || kind == TypeKind::Adt || kind == TypeKind::Generic;
  }

  /// Name used for nominal comparison ("Int" for primitives)
  [[nodiscard]] std::string_view base_name() const noexcept;

  /// Find a variant by name (Adt only)
  [[nodiscard]] const VariantInfo * find_variant(std::string_view variant) const noexcept;
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Type context for interning and managing semantic types.
 *
 * Provides singleton instances for built-in types and creates interned
 * composite types on demand. Nominal types (records, ADTs) are identified
 * by their declaration and are created once per declaration.
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Built-in Types (Singletons)
  // ===========================================================================

  [[nodiscard]] const Type * int_type() const noexcept { return &int_; }
  [[nodiscard]] const Type * float_type() const noexcept { return &float_; }
  [[nodiscard]] const Type * string_type() const noexcept { return &string_; }
  [[nodiscard]] const Type * bool_type() const noexcept { return &bool_; }
  [[nodiscard]] const Type * nil_type() const noexcept { return &nil_; }
  [[nodiscard]] const Type * any_type() const noexcept { return &any_; }
  [[nodiscard]] const Type * unknown_type() const noexcept { return &unknown_; }

  // ===========================================================================
  // Composite Type Creation (Interned)
  // ===========================================================================

  const Type * get_array_type(const Type * element_type);
  const Type * get_tuple_type(const std::vector<const Type *> & elements);
  const Type * get_function_type(
    const std::vector<const Type *> & params, const Type * return_type);
  const Type * get_generic_type(std::string_view name, const std::vector<const Type *> & args);
  const Type * get_type_variable(std::string_view name);

  /// Union of the given members; flattens nested unions and collapses
  /// duplicates. A single remaining member is returned as-is.
  const Type * get_union_type(const std::vector<const Type *> & members);

  // ===========================================================================
  // Nominal Types
  // ===========================================================================

  /**
   * Create the record type for `decl`. Field types are attached later with
   * set_record_fields() so that self-referential declarations resolve.
   */
  Type * create_record_type(std::string_view name, const AstNode * decl);
  void set_record_fields(
    Type * record, const std::vector<std::string_view> & names,
    const std::vector<const Type *> & types);

  Type * create_adt_type(
    std::string_view name, const std::vector<std::string_view> & type_params,
    const AstNode * decl);
  void add_variant(
    Type * adt, std::string_view name, const std::vector<std::string_view> & field_names,
    const std::vector<const Type *> & field_types);

  // ===========================================================================
  // Type Lookup by Name
  // ===========================================================================

  /// Look up a built-in type by name ("Int", "String", "Any", ...).
  /// Returns nullptr if not a built-in type.
  [[nodiscard]] const Type * lookup_builtin(std::string_view name) const;

private:
  template <typename T>
  gsl::span<const T> copy_array(const std::vector<T> & values);

  // Built-in type singletons
  Type int_, float_, string_, bool_, nil_;
  Type any_, unknown_;

  // Arena for composite types and their element arrays
  std::pmr::monotonic_buffer_resource arena_{4096};
  // Pointers to interned types are handed out widely, so the container
  // must keep element addresses stable.
  std::pmr::deque<Type> composite_types_{&arena_};
  // Variant lists grow while an ADT is being declared.
  std::deque<std::vector<VariantInfo>> variant_storage_;
};

}  // namespace tova
