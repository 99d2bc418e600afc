// tova/sema/resolution/symbol_table.cpp - Scope implementation
//
#include "tova/sema/resolution/symbol_table.hpp"

namespace tova
{

std::string_view to_string(SymbolKind kind) noexcept
{
  switch (kind) {
    case SymbolKind::Variable:
      return "variable";
    case SymbolKind::Parameter:
      return "parameter";
    case SymbolKind::Function:
      return "function";
    case SymbolKind::Type:
      return "type";
    case SymbolKind::Variant:
      return "variant";
    case SymbolKind::State:
      return "state";
    case SymbolKind::Computed:
      return "computed";
    case SymbolKind::Component:
      return "component";
    case SymbolKind::Store:
      return "store";
    case SymbolKind::Import:
      return "import";
    case SymbolKind::Builtin:
      return "builtin";
  }
  return "symbol";
}

std::string_view to_string(ScopeContext ctx) noexcept
{
  switch (ctx) {
    case ScopeContext::Module:
      return "module";
    case ScopeContext::Server:
      return "server";
    case ScopeContext::Client:
      return "client";
    case ScopeContext::Shared:
      return "shared";
    case ScopeContext::Edge:
      return "edge";
    case ScopeContext::Function:
      return "function";
    case ScopeContext::Block:
      return "block";
  }
  return "block";
}

Symbol * Scope::lookup_to_boundary(std::string_view name)
{
  for (Scope * s = this; s != nullptr; s = s->parent_) {
    if (Symbol * sym = s->lookup_local(name)) return sym;
    if (s->is_boundary()) break;
  }
  return nullptr;
}

bool Scope::defined_beyond_boundary(std::string_view name)
{
  Scope * s = this;
  while (s != nullptr && !s->is_boundary()) s = s->parent_;
  if (s == nullptr || s->parent_ == nullptr) return false;
  const Symbol * outer = s->parent_->lookup(name);
  return outer != nullptr && outer->kind != SymbolKind::Builtin;
}

std::vector<std::string_view> Scope::visible_names() const
{
  std::vector<std::string_view> out;
  for (const Scope * s = this; s != nullptr; s = s->parent_) {
    out.insert(out.end(), s->order_.begin(), s->order_.end());
  }
  return out;
}

ScopeContext Scope::region_context() const noexcept
{
  for (const Scope * s = this; s != nullptr; s = s->parent_) {
    switch (s->context_) {
      case ScopeContext::Server:
      case ScopeContext::Client:
      case ScopeContext::Shared:
      case ScopeContext::Edge:
        return s->context_;
      default:
        break;
    }
  }
  return ScopeContext::Module;
}

}  // namespace tova
