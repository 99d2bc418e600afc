// tova/sema/types/type_utils.hpp - Shared type utilities
//
// Assignability, printing and annotation resolution used by the analyzer.
//
#pragma once

#include <optional>
#include <string>

#include "tova/sema/types/type.hpp"

namespace tova
{

// Forward declarations
class TypeTable;
class TypeNode;

// ============================================================================
// Type Compatibility
// ============================================================================

/**
 * Check if source type can be assigned to target type.
 *
 * Gradual rules:
 * - Any, Unknown and type variables are compatible in both directions
 * - Int widens to Float; Float never narrows to Int
 * - Nil is assignable to Option-shaped types
 * - Arrays are covariant, tuples compare element-wise
 * - Functions must agree structurally
 * - A union source needs every member assignable; a union target needs one
 * - Nominal types match by base name; a Generic without arguments matches
 *   every instantiation of the same base
 *
 * @param target The type being assigned to
 * @param source The type being assigned from
 * @return true if assignment is allowed (also when either side is nullptr)
 */
[[nodiscard]] bool is_assignable(const Type * target, const Type * source);

/**
 * Check if source type can be implicitly widened to target type.
 *
 * The only widening is Int → Float.
 */
[[nodiscard]] bool can_widen(const Type * from, const Type * to);

/// True when both types are known and neither is dynamic.
[[nodiscard]] bool both_known(const Type * a, const Type * b);

/**
 * Convert a Type to its string representation.
 *
 * @return e.g. "Int", "[String]", "Result<Int, String>", "fn(Int) -> Bool"
 */
[[nodiscard]] std::string to_string(const Type * type);

/**
 * Suggest a conversion for a mismatch of `actual` against `expected`.
 *
 * @return e.g. "try toInt(value) to parse", or nullopt when nothing applies
 */
[[nodiscard]] std::optional<std::string> conversion_hint(
  const Type * expected, const Type * actual);

// ============================================================================
// Type Resolution from AST
// ============================================================================

/**
 * Resolve a TypeNode AST node to a semantic Type.
 *
 * Names listed in `type_params` resolve to type variables. Unknown names
 * resolve to an argument-carrying Generic so that gradual checks still
 * compare them by name.
 *
 * @param types TypeContext for creating types
 * @param typeTable TypeTable for looking up declared type names
 * @param node The TypeNode AST to resolve (nullptr yields Unknown)
 * @param type_params Generic parameters in scope
 */
[[nodiscard]] const Type * resolve_type_node(
  TypeContext & types, const TypeTable & typeTable, const TypeNode * node,
  gsl::span<const std::string_view> type_params = {});

}  // namespace tova
