// tova/basic/error_codes.hpp - Stable diagnostic codes
#pragma once

#include <string_view>

namespace tova::error_codes
{

// Lexer / parser
inline constexpr std::string_view k_unexpected_token = "E001";
inline constexpr std::string_view k_unterminated_string = "E002";
inline constexpr std::string_view k_expected_closing = "E003";
inline constexpr std::string_view k_invalid_number = "E004";
inline constexpr std::string_view k_unexpected_character = "E005";
inline constexpr std::string_view k_unterminated_comment = "E006";
inline constexpr std::string_view k_expected_expression = "E007";
inline constexpr std::string_view k_mismatched_jsx_tag = "E008";
inline constexpr std::string_view k_invalid_operator = "E009";

// Types
inline constexpr std::string_view k_type_mismatch = "E100";
inline constexpr std::string_view k_return_type_mismatch = "E101";
inline constexpr std::string_view k_cannot_assign = "E102";
inline constexpr std::string_view k_invalid_argument_type = "E103";
inline constexpr std::string_view k_wrong_argument_count = "E104";
inline constexpr std::string_view k_unknown_type = "E105";

// Scope
inline constexpr std::string_view k_undefined = "E200";
inline constexpr std::string_view k_duplicate = "E201";
inline constexpr std::string_view k_immutable_reassign = "E202";

// Async
inline constexpr std::string_view k_await_outside_async = "E300";

// Warnings
inline constexpr std::string_view k_unused_variable = "W001";
inline constexpr std::string_view k_naming_convention = "W100";
inline constexpr std::string_view k_shadowed_binding = "W101";
inline constexpr std::string_view k_non_exhaustive_match = "W200";
inline constexpr std::string_view k_unreachable_code = "W201";
inline constexpr std::string_view k_possible_data_loss = "W204";
inline constexpr std::string_view k_missing_return = "W205";
inline constexpr std::string_view k_unreachable_arm = "W207";

/// Short title for a code ("Type mismatch"), or empty for unknown codes.
[[nodiscard]] std::string_view title(std::string_view code) noexcept;

/// True for codes in the warning range ("Wxxx").
[[nodiscard]] constexpr bool is_warning_code(std::string_view code) noexcept
{
  return !code.empty() && code.front() == 'W';
}

}  // namespace tova::error_codes
