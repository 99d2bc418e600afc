// tova/codegen/stdlib.hpp - Tree-shaken JavaScript standard library
//
// Every builtin the generated code may reference is a fragment of JS
// source plus the names it depends on. Emission concatenates only the
// fragments that were actually referenced, dependencies first.
//
#pragma once

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tova::codegen::stdlib
{

struct Fragment
{
  std::string_view name;
  std::string_view code;
  std::vector<std::string_view> deps;
};

/// All fragments in declaration order.
[[nodiscard]] const std::vector<Fragment> & fragments();

/// nullptr when `name` has no fragment.
[[nodiscard]] const Fragment * find(std::string_view name);

/// True for names user code can reference directly (everything except
/// the `__`-prefixed runtime helpers).
[[nodiscard]] bool is_user_visible(std::string_view name);

/**
 * Transitive closure of `used`, ordered so that every fragment follows
 * its dependencies. Ties keep declaration order. Unknown names are
 * skipped.
 */
[[nodiscard]] std::vector<std::string_view> resolve(const std::set<std::string> & used);

/// Source text of resolve(used), one fragment per block.
[[nodiscard]] std::string emit(const std::set<std::string> & used);

}  // namespace tova::codegen::stdlib
