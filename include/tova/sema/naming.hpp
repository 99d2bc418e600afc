// tova/sema/naming.hpp - Identifier case conventions and typo suggestions
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tova::naming
{

/// `snake_case`; also accepts single characters, `_`-prefixed names and
/// UPPER_SNAKE constants.
[[nodiscard]] bool is_snake_case(std::string_view name) noexcept;

/// `PascalCase`: uppercase first letter, alphanumerics only.
[[nodiscard]] bool is_pascal_case(std::string_view name) noexcept;

/// `UPPER_SNAKE_CASE`.
[[nodiscard]] bool is_upper_snake_case(std::string_view name) noexcept;

/// `fooBar` → `foo_bar`.
[[nodiscard]] std::string to_snake_case(std::string_view name);

/// `foo_bar` → `FooBar`.
[[nodiscard]] std::string to_pascal_case(std::string_view name);

/// Levenshtein distance.
[[nodiscard]] size_t edit_distance(std::string_view a, std::string_view b);

/**
 * Closest candidate to `name` by case-insensitive edit distance.
 *
 * The threshold is max(2, floor(0.4 * len)). Candidates whose length
 * differs by more than the threshold are skipped, and an exact match
 * (distance 0) is never suggested.
 */
[[nodiscard]] std::optional<std::string_view> closest_match(
  std::string_view name, const std::vector<std::string_view> & candidates);

}  // namespace tova::naming
