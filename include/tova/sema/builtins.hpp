// tova/sema/builtins.hpp - Names the analyzer treats as predeclared
//
// Three disjoint sets: the Tova standard library (free functions,
// classes and namespace objects), Tova runtime names (result types,
// implicit region objects) and host JavaScript globals.
//
#pragma once

#include <string_view>
#include <vector>

namespace tova::builtins
{

/// Standard library names, in the order the code generator's fragment
/// table declares them.
[[nodiscard]] const std::vector<std::string_view> & stdlib_names();

/// `Ok`, `Err`, `Some`, `None`, `Result`, `Option` and the implicit
/// region objects (`db`, `server`, `client`, `shared`).
[[nodiscard]] const std::vector<std::string_view> & runtime_names();

/// Host platform globals (`console`, `Math`, `fetch`, ...).
[[nodiscard]] const std::vector<std::string_view> & js_global_names();

[[nodiscard]] bool is_stdlib_name(std::string_view name);
[[nodiscard]] bool is_runtime_name(std::string_view name);
[[nodiscard]] bool is_js_global(std::string_view name);

/// Any of the three sets.
[[nodiscard]] bool is_known_global(std::string_view name);

}  // namespace tova::builtins
