// tova/sema/naming.cpp - Identifier case conventions and typo suggestions
#include "tova/sema/naming.hpp"

#include <algorithm>
#include <cctype>

namespace tova::naming
{

namespace
{

bool is_lower_or_digit(char c)
{
  return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

bool is_upper_or_digit(char c)
{
  return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

// Matches ^[first][rest]*(_[rest]+)*$ for the given character classes.
template <typename First, typename Rest>
bool matches_segments(std::string_view name, First first, Rest rest)
{
  if (name.empty() || !first(name.front())) return false;
  bool after_underscore = false;
  for (size_t i = 1; i < name.size(); ++i) {
    const char c = name[i];
    if (c == '_') {
      if (after_underscore) return false;
      after_underscore = true;
      continue;
    }
    if (!rest(c)) return false;
    after_underscore = false;
  }
  return !after_underscore;
}

char lower(char c)
{
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

}  // namespace

bool is_upper_snake_case(std::string_view name) noexcept
{
  return matches_segments(
    name, [](char c) { return c >= 'A' && c <= 'Z'; }, is_upper_or_digit);
}

bool is_snake_case(std::string_view name) noexcept
{
  if (name.empty()) return false;
  if (name.front() == '_' || name.size() == 1) return true;
  if (is_upper_snake_case(name)) return true;
  return matches_segments(
    name, [](char c) { return c >= 'a' && c <= 'z'; }, is_lower_or_digit);
}

bool is_pascal_case(std::string_view name) noexcept
{
  if (name.empty() || !(name.front() >= 'A' && name.front() <= 'Z')) return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
  });
}

std::string to_snake_case(std::string_view name)
{
  std::string out;
  out.reserve(name.size() + 4);
  for (size_t i = 0; i < name.size(); ++i) {
    const char c = name[i];
    if (i > 0 && c >= 'A' && c <= 'Z' && is_lower_or_digit(name[i - 1])) {
      out += '_';
    }
    out += lower(c);
  }
  return out;
}

std::string to_pascal_case(std::string_view name)
{
  std::string out;
  out.reserve(name.size());
  bool boundary = true;
  for (const char c : name) {
    if (c == '_') {
      boundary = true;
      continue;
    }
    if (boundary && c >= 'a' && c <= 'z') {
      out += static_cast<char>(c - 'a' + 'A');
    } else {
      out += c;
    }
    boundary = false;
  }
  return out;
}

size_t edit_distance(std::string_view a, std::string_view b)
{
  std::vector<size_t> prev(b.size() + 1);
  std::vector<size_t> cur(b.size() + 1);
  for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

  for (size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (size_t j = 1; j <= b.size(); ++j) {
      const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[b.size()];
}

std::optional<std::string_view> closest_match(
  std::string_view name, const std::vector<std::string_view> & candidates)
{
  const size_t max_dist = std::max<size_t>(2, (name.size() * 2) / 5);

  std::string needle(name);
  std::transform(needle.begin(), needle.end(), needle.begin(), lower);

  std::optional<std::string_view> best;
  size_t best_dist = max_dist + 1;
  std::string folded;
  for (const auto candidate : candidates) {
    const size_t len_diff = candidate.size() > name.size() ? candidate.size() - name.size()
                                                           : name.size() - candidate.size();
    if (len_diff > max_dist) continue;

    folded.assign(candidate.begin(), candidate.end());
    std::transform(folded.begin(), folded.end(), folded.begin(), lower);
    const size_t d = edit_distance(needle, folded);
    if (d > 0 && d < best_dist) {
      best_dist = d;
      best = candidate;
    }
  }
  return best;
}

}  // namespace tova::naming
