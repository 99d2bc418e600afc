// tova/sema/types/type_utils.cpp - Shared type utilities implementation
//
#include "tova/sema/types/type_utils.hpp"

#include <algorithm>

#include "tova/ast/ast.hpp"
#include "tova/sema/types/type_table.hpp"

namespace tova
{

namespace
{

bool is_option_shaped(const Type * t)
{
  return t->is_nominal() && t->name == "Option";
}

bool accepts_nil(const Type * target)
{
  if (target->kind == TypeKind::Nil || is_option_shaped(target)) return true;
  if (target->kind == TypeKind::Union) {
    return std::any_of(target->elements.begin(), target->elements.end(), [](const Type * m) {
      return m->kind == TypeKind::Nil || is_option_shaped(m);
    });
  }
  return false;
}

bool elements_assignable(gsl::span<const Type * const> target, gsl::span<const Type * const> source)
{
  if (target.size() != source.size()) return false;
  for (size_t i = 0; i < target.size(); ++i) {
    if (!is_assignable(target[i], source[i])) return false;
  }
  return true;
}

bool nominal_assignable(const Type * target, const Type * source)
{
  if (target->base_name() != source->base_name() || target->base_name().empty()) return false;

  // Only Generic carries instantiation arguments. An uninstantiated side
  // (or a declaration type) matches any instantiation.
  if (target->kind != TypeKind::Generic || source->kind != TypeKind::Generic) return true;
  if (target->elements.empty() || source->elements.empty()) return true;
  return elements_assignable(target->elements, source->elements);
}

}  // namespace

// ============================================================================
// Type Compatibility
// ============================================================================

bool can_widen(const Type * from, const Type * to)
{
  return from && to && from->kind == TypeKind::Int && to->kind == TypeKind::Float;
}

bool both_known(const Type * a, const Type * b)
{
  return a && b && !a->is_opaque() && !b->is_opaque();
}

bool is_assignable(const Type * target, const Type * source)
{
  if (!target || !source) return true;
  if (target == source) return true;
  if (target->is_opaque() || source->is_opaque()) return true;

  if (source->kind == TypeKind::Nil) return accepts_nil(target);

  if (source->kind == TypeKind::Union) {
    return std::all_of(source->elements.begin(), source->elements.end(), [target](const Type * m) {
      return is_assignable(target, m);
    });
  }
  if (target->kind == TypeKind::Union) {
    return std::any_of(target->elements.begin(), target->elements.end(), [source](const Type * m) {
      return is_assignable(m, source);
    });
  }

  if (can_widen(source, target)) return true;

  switch (target->kind) {
    case TypeKind::Array:
      return source->kind == TypeKind::Array &&
             is_assignable(target->element_type, source->element_type);

    case TypeKind::Tuple:
      return source->kind == TypeKind::Tuple &&
             elements_assignable(target->elements, source->elements);

    case TypeKind::Function:
      return source->kind == TypeKind::Function &&
             elements_assignable(target->elements, source->elements) &&
             elements_assignable(source->elements, target->elements) &&
             is_assignable(target->return_type, source->return_type) &&
             is_assignable(source->return_type, target->return_type);

    case TypeKind::Int:
    case TypeKind::Float:
    case TypeKind::String:
    case TypeKind::Bool:
      // A nominal type that shares the primitive's base name (e.g. a user
      // record named like a builtin) is accepted.
      return source->is_nominal() && source->base_name() == target->base_name();

    case TypeKind::Record:
    case TypeKind::Adt:
    case TypeKind::Generic:
      return source->is_nominal() && nominal_assignable(target, source);

    default:
      return false;
  }
}

// ============================================================================
// Printing
// ============================================================================

std::string to_string(const Type * type)
{
  if (!type) return "Unknown";

  auto join = [](gsl::span<const Type * const> types, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < types.size(); ++i) {
      if (i > 0) out += sep;
      out += to_string(types[i]);
    }
    return out;
  };

  switch (type->kind) {
    case TypeKind::Int:
      return "Int";
    case TypeKind::Float:
      return "Float";
    case TypeKind::String:
      return "String";
    case TypeKind::Bool:
      return "Bool";
    case TypeKind::Nil:
      return "Nil";
    case TypeKind::Any:
      return "Any";
    case TypeKind::Unknown:
      return "Unknown";
    case TypeKind::Array:
      return "[" + to_string(type->element_type) + "]";
    case TypeKind::Tuple:
      return "(" + join(type->elements, ", ") + ")";
    case TypeKind::Function:
      return "fn(" + join(type->elements, ", ") + ") -> " + to_string(type->return_type);
    case TypeKind::Generic:
      if (type->elements.empty()) return std::string(type->name);
      return std::string(type->name) + "<" + join(type->elements, ", ") + ">";
    case TypeKind::Record:
    case TypeKind::Adt:
    case TypeKind::TypeVariable:
      return std::string(type->name);
    case TypeKind::Union:
      return join(type->elements, " | ");
  }
  return "Unknown";
}

std::optional<std::string> conversion_hint(const Type * expected, const Type * actual)
{
  if (!expected || !actual) return std::nullopt;

  if (expected->kind == TypeKind::String) {
    if (actual->is_numeric() || actual->kind == TypeKind::Bool) {
      return "try toString(value) to convert";
    }
  }
  if (actual->kind == TypeKind::String) {
    if (expected->kind == TypeKind::Int) return "try toInt(value) to parse";
    if (expected->kind == TypeKind::Float) return "try toFloat(value) to parse";
  }
  if (actual->kind == TypeKind::Float && expected->kind == TypeKind::Int) {
    return "try floor(value) or round(value) to convert";
  }
  if (expected->is_nominal()) {
    if (expected->name == "Result") return "try Ok(value) to wrap in Result";
    if (expected->name == "Option") return "try Some(value) to wrap in Option";
  }
  return std::nullopt;
}

// ============================================================================
// Type Resolution from AST
// ============================================================================

const Type * resolve_type_node(
  TypeContext & types, const TypeTable & typeTable, const TypeNode * node,
  gsl::span<const std::string_view> type_params)
{
  if (!node) return types.unknown_type();

  auto resolve_all = [&](gsl::span<TypeNode *> nodes) {
    std::vector<const Type *> out;
    out.reserve(nodes.size());
    for (const auto * n : nodes) {
      out.push_back(resolve_type_node(types, typeTable, n, type_params));
    }
    return out;
  };

  switch (node->get_kind()) {
    case NodeKind::NamedType: {
      const auto * named = cast<NamedType>(node);
      if (std::find(type_params.begin(), type_params.end(), named->name) != type_params.end()) {
        return types.get_type_variable(named->name);
      }
      if (const Type * builtin = types.lookup_builtin(named->name)) {
        return builtin;
      }
      if (const TypeSymbol * sym = typeTable.lookup(named->name)) {
        if (sym->type && named->typeArgs.empty()) return sym->type;
        if (sym->type && sym->type->kind != TypeKind::Adt) return sym->type;
      }
      return types.get_generic_type(named->name, resolve_all(named->typeArgs));
    }

    case NodeKind::ArrayType: {
      const auto * arr = cast<ArrayType>(node);
      return types.get_array_type(
        resolve_type_node(types, typeTable, arr->elementType, type_params));
    }

    case NodeKind::TupleType:
      return types.get_tuple_type(resolve_all(cast<TupleType>(node)->elements));

    case NodeKind::FunctionType: {
      const auto * fn = cast<FunctionType>(node);
      return types.get_function_type(
        resolve_all(fn->params), resolve_type_node(types, typeTable, fn->returnType, type_params));
    }

    default:
      return types.unknown_type();
  }
}

}  // namespace tova
