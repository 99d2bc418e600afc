// tova/sema/types/type.cpp - Type context implementation
//
#include "tova/sema/types/type.hpp"

#include <algorithm>

namespace tova
{

// ============================================================================
// Type Queries
// ============================================================================

std::string_view Type::base_name() const noexcept
{
  switch (kind) {
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
    case TypeKind::Record:
    case TypeKind::Adt:
    case TypeKind::Generic:
    case TypeKind::TypeVariable:
      return name;
    default:
      return {};
  }
}

const VariantInfo * Type::find_variant(std::string_view variant) const noexcept
{
  for (const auto & v : variants) {
    if (v.name == variant) return &v;
  }
  return nullptr;
}

// ============================================================================
// TypeContext Implementation
// ============================================================================

TypeContext::TypeContext()
{
  int_ = Type{TypeKind::Int};
  float_ = Type{TypeKind::Float};
  string_ = Type{TypeKind::String};
  bool_ = Type{TypeKind::Bool};
  nil_ = Type{TypeKind::Nil};
  any_ = Type{TypeKind::Any};
  unknown_ = Type{TypeKind::Unknown};
}

template <typename T>
gsl::span<const T> TypeContext::copy_array(const std::vector<T> & values)
{
  if (values.empty()) return {};
  T * const ptr = static_cast<T *>(arena_.allocate(sizeof(T) * values.size(), alignof(T)));
  std::uninitialized_copy(values.begin(), values.end(), ptr);
  return gsl::span<const T>(ptr, values.size());
}

namespace
{

bool same_elements(gsl::span<const Type * const> a, const std::vector<const Type *> & b)
{
  return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin());
}

}  // namespace

const Type * TypeContext::get_array_type(const Type * element_type)
{
  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Array && t.element_type == element_type) {
      return &t;
    }
  }

  Type new_type{TypeKind::Array};
  new_type.element_type = element_type;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_tuple_type(const std::vector<const Type *> & elements)
{
  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Tuple && same_elements(t.elements, elements)) {
      return &t;
    }
  }

  Type new_type{TypeKind::Tuple};
  new_type.elements = copy_array(elements);
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_function_type(
  const std::vector<const Type *> & params, const Type * return_type)
{
  for (const auto & t : composite_types_) {
    if (
      t.kind == TypeKind::Function && t.return_type == return_type &&
      same_elements(t.elements, params)) {
      return &t;
    }
  }

  Type new_type{TypeKind::Function};
  new_type.elements = copy_array(params);
  new_type.return_type = return_type;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_generic_type(
  std::string_view name, const std::vector<const Type *> & args)
{
  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Generic && t.name == name && same_elements(t.elements, args)) {
      return &t;
    }
  }

  Type new_type{TypeKind::Generic};
  new_type.name = name;
  new_type.elements = copy_array(args);
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_type_variable(std::string_view name)
{
  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::TypeVariable && t.name == name) {
      return &t;
    }
  }

  Type new_type{TypeKind::TypeVariable};
  new_type.name = name;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

const Type * TypeContext::get_union_type(const std::vector<const Type *> & members)
{
  std::vector<const Type *> flat;
  for (const Type * m : members) {
    if (m == nullptr) continue;
    if (m->kind == TypeKind::Union) {
      for (const Type * inner : m->elements) {
        if (std::find(flat.begin(), flat.end(), inner) == flat.end()) flat.push_back(inner);
      }
    } else if (std::find(flat.begin(), flat.end(), m) == flat.end()) {
      flat.push_back(m);
    }
  }
  if (flat.empty()) return unknown_type();
  if (flat.size() == 1) return flat.front();

  for (const auto & t : composite_types_) {
    if (t.kind == TypeKind::Union && same_elements(t.elements, flat)) {
      return &t;
    }
  }

  Type new_type{TypeKind::Union};
  new_type.elements = copy_array(flat);
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

Type * TypeContext::create_record_type(std::string_view name, const AstNode * decl)
{
  Type new_type{TypeKind::Record};
  new_type.name = name;
  new_type.decl = decl;
  composite_types_.push_back(new_type);
  return &composite_types_.back();
}

void TypeContext::set_record_fields(
  Type * record, const std::vector<std::string_view> & names,
  const std::vector<const Type *> & types)
{
  record->field_names = copy_array(names);
  record->elements = copy_array(types);
}

Type * TypeContext::create_adt_type(
  std::string_view name, const std::vector<std::string_view> & type_params,
  const AstNode * decl)
{
  Type new_type{TypeKind::Adt};
  new_type.name = name;
  new_type.type_params = copy_array(type_params);
  new_type.decl = decl;
  composite_types_.push_back(new_type);
  variant_storage_.emplace_back();
  return &composite_types_.back();
}

void TypeContext::add_variant(
  Type * adt, std::string_view name, const std::vector<std::string_view> & field_names,
  const std::vector<const Type *> & field_types)
{
  // Find the storage slot belonging to this ADT (one slot per created ADT,
  // in creation order).
  size_t slot = 0;
  for (const auto & t : composite_types_) {
    if (&t == adt) break;
    if (t.kind == TypeKind::Adt) ++slot;
  }
  auto & variants = variant_storage_.at(slot);
  variants.push_back(VariantInfo{name, copy_array(field_names), copy_array(field_types)});
  adt->variants = gsl::span<const VariantInfo>(variants.data(), variants.size());
}

const Type * TypeContext::lookup_builtin(std::string_view name) const
{
  if (name == "Int") return &int_;
  if (name == "Float") return &float_;
  if (name == "String") return &string_;
  if (name == "Bool") return &bool_;
  if (name == "Nil") return &nil_;
  if (name == "Any") return &any_;

  // Aliases
  if (name == "Number") return &float_;
  if (name == "Str") return &string_;

  return nullptr;
}

}  // namespace tova
