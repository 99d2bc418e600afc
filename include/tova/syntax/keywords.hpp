// tova/syntax/keywords.hpp - Reserved words and operator spellings
#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

#include "tova/syntax/token.hpp"

namespace tova::syntax
{

inline constexpr std::array<std::pair<std::string_view, TokenKind>, 43> k_keywords = {{
  {"var", TokenKind::KwVar},
  {"let", TokenKind::KwLet},
  {"fn", TokenKind::KwFn},
  {"return", TokenKind::KwReturn},
  {"if", TokenKind::KwIf},
  {"elif", TokenKind::KwElif},
  {"else", TokenKind::KwElse},
  {"for", TokenKind::KwFor},
  {"while", TokenKind::KwWhile},
  {"match", TokenKind::KwMatch},
  {"type", TokenKind::KwType},
  {"import", TokenKind::KwImport},
  {"from", TokenKind::KwFrom},
  {"export", TokenKind::KwExport},
  {"as", TokenKind::KwAs},
  {"and", TokenKind::KwAnd},
  {"or", TokenKind::KwOr},
  {"not", TokenKind::KwNot},
  {"in", TokenKind::KwIn},
  {"true", TokenKind::KwTrue},
  {"false", TokenKind::KwFalse},
  {"nil", TokenKind::KwNil},
  {"break", TokenKind::KwBreak},
  {"continue", TokenKind::KwContinue},
  {"try", TokenKind::KwTry},
  {"catch", TokenKind::KwCatch},
  {"finally", TokenKind::KwFinally},
  {"async", TokenKind::KwAsync},
  {"await", TokenKind::KwAwait},
  {"guard", TokenKind::KwGuard},
  {"interface", TokenKind::KwInterface},
  {"derive", TokenKind::KwDerive},
  {"pub", TokenKind::KwPub},
  {"mut", TokenKind::KwMut},
  {"server", TokenKind::KwServer},
  {"client", TokenKind::KwClient},
  {"shared", TokenKind::KwShared},
  {"route", TokenKind::KwRoute},
  {"state", TokenKind::KwState},
  {"computed", TokenKind::KwComputed},
  {"effect", TokenKind::KwEffect},
  {"component", TokenKind::KwComponent},
  {"store", TokenKind::KwStore},
}};

// Longest spellings first so a linear scan performs maximal munch.
inline constexpr std::array<std::pair<std::string_view, TokenKind>, 39> k_operators = {{
  {"...", TokenKind::Ellipsis},
  {"..=", TokenKind::DotDotEq},
  {"**", TokenKind::StarStar},
  {"..", TokenKind::DotDot},
  {"?.", TokenKind::QuestionDot},
  {"??", TokenKind::QuestionQuestion},
  {"->", TokenKind::Arrow},
  {"=>", TokenKind::FatArrow},
  {"|>", TokenKind::PipeGt},
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::BangEq},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
  {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},
  {"*=", TokenKind::StarEq},
  {"/=", TokenKind::SlashEq},
  {"(", TokenKind::LParen},
  {")", TokenKind::RParen},
  {"{", TokenKind::LBrace},
  {"}", TokenKind::RBrace},
  {"[", TokenKind::LBracket},
  {"]", TokenKind::RBracket},
  {",", TokenKind::Comma},
  {":", TokenKind::Colon},
  {";", TokenKind::Semicolon},
  {".", TokenKind::Dot},
  {"@", TokenKind::At},
  {"?", TokenKind::Question},
  {"+", TokenKind::Plus},
  {"-", TokenKind::Minus},
  {"*", TokenKind::Star},
  {"/", TokenKind::Slash},
  {"%", TokenKind::Percent},
  {"!", TokenKind::Bang},
  {"=", TokenKind::Eq},
  {"<", TokenKind::Lt},
}};

// A lone '>' is matched by the lexer itself so that a JSX tag can close
// before maximal munch applies.

[[nodiscard]] constexpr std::optional<TokenKind> lookup_keyword(std::string_view word) noexcept
{
  for (const auto & [spelling, kind] : k_keywords) {
    if (spelling == word) {
      return kind;
    }
  }
  return std::nullopt;
}

/// Names that are keywords in JSX children position and open control flow.
inline constexpr std::array<std::string_view, 4> k_jsx_control_keywords = {
  "if",
  "elif",
  "else",
  "for",
};

}  // namespace tova::syntax
