// tova/codegen/emit_context.hpp - Mutable state shared by one generate() call
//
// The context records which stdlib fragments the emitted code references
// (for tree-shaking), which top-level names the user defined (those
// shadow builtins), the declared field names of every ADT variant, and a
// counter for unique temporaries. It is owned by CodeGenerator::generate()
// and passed by reference into every emitter.
//
#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "tova/ast/ast.hpp"

namespace tova::codegen
{

class EmitContext
{
public:
  EmitContext();

  /// Mark a stdlib fragment as referenced. Names the user defined are ignored.
  void use(std::string_view name);

  [[nodiscard]] bool is_used(std::string_view name) const
  {
    return usedBuiltins.count(std::string(name)) != 0;
  }

  void define(std::string_view name) { userDefined.emplace(name); }

  [[nodiscard]] bool is_user_defined(std::string_view name) const
  {
    return userDefined.count(std::string(name)) != 0;
  }

  /// Fresh suffix for temporaries (`__results_3`, `__iter_4`, ...).
  [[nodiscard]] uint32_t next_id() noexcept { return ++counter_; }

  void set_variant_fields(std::string_view variant, std::vector<std::string> fields)
  {
    variantFields[std::string(variant)] = std::move(fields);
  }

  /// Declared field names of `variant`; empty when unknown.
  [[nodiscard]] const std::vector<std::string> & field_names(std::string_view variant) const;

  std::set<std::string> usedBuiltins;
  std::unordered_set<std::string> userDefined;
  std::map<std::string, std::vector<std::string>> variantFields;

private:
  uint32_t counter_ = 0;
};

/**
 * Fill `ctx` from a whole program before any emission: user-defined
 * top-level names first (functions, types, variants, imports, module
 * bindings), then every referenced builtin and runtime helper.
 */
void collect_usage(const Program & program, EmitContext & ctx);

}  // namespace tova::codegen
