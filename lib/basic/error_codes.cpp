// tova/basic/error_codes.cpp - Code title table
#include "tova/basic/error_codes.hpp"

#include <array>
#include <utility>

namespace tova::error_codes
{
namespace
{

constexpr std::array<std::pair<std::string_view, std::string_view>, 27> k_titles = {{
  {k_unexpected_token, "Unexpected token"},
  {k_unterminated_string, "Unterminated string"},
  {k_expected_closing, "Expected closing delimiter"},
  {k_invalid_number, "Invalid number literal"},
  {k_unexpected_character, "Unexpected character"},
  {k_unterminated_comment, "Unterminated comment"},
  {k_expected_expression, "Expected expression"},
  {k_mismatched_jsx_tag, "Mismatched JSX tag"},
  {k_invalid_operator, "Invalid operator"},
  {k_type_mismatch, "Type mismatch"},
  {k_return_type_mismatch, "Return type mismatch"},
  {k_cannot_assign, "Cannot assign"},
  {k_invalid_argument_type, "Invalid argument type"},
  {k_wrong_argument_count, "Wrong number of arguments"},
  {k_unknown_type, "Unknown type"},
  {k_undefined, "Undefined identifier"},
  {k_duplicate, "Duplicate definition"},
  {k_immutable_reassign, "Cannot reassign immutable binding"},
  {k_await_outside_async, "'await' outside async function"},
  {k_unused_variable, "Unused variable"},
  {k_naming_convention, "Naming convention"},
  {k_shadowed_binding, "Shadowed binding"},
  {k_non_exhaustive_match, "Non-exhaustive match"},
  {k_unreachable_code, "Unreachable code"},
  {k_possible_data_loss, "Possible data loss"},
  {k_missing_return, "Missing return"},
  {k_unreachable_arm, "Unreachable match arm"},
}};

}  // namespace

std::string_view title(std::string_view code) noexcept
{
  for (const auto & [c, t] : k_titles) {
    if (c == code) {
      return t;
    }
  }
  return {};
}

}  // namespace tova::error_codes
