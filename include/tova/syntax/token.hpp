// tova/syntax/token.hpp - Token kinds and token value type
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tova/basic/source_manager.hpp"

namespace tova::syntax
{

enum class TokenKind : uint8_t {
  Eof,

  Identifier,
  Number,
  String,       // literal without interpolation; value is the decoded contents
  Template,     // literal with `{expr}` parts; see Token::parts
  DocComment,   // /// ...; value is the trimmed text
  JsxText,      // text between JSX tags; value has whitespace collapsed
  JsxTagOpen,   // '<' that starts a JSX tag (opening or closing)
  StyleBlock,   // style { ... }; value is the raw body

  // Keywords
  KwVar,
  KwLet,
  KwFn,
  KwReturn,
  KwIf,
  KwElif,
  KwElse,
  KwFor,
  KwWhile,
  KwMatch,
  KwType,
  KwImport,
  KwFrom,
  KwExport,
  KwAs,
  KwAnd,
  KwOr,
  KwNot,
  KwIn,
  KwTrue,
  KwFalse,
  KwNil,
  KwBreak,
  KwContinue,
  KwTry,
  KwCatch,
  KwFinally,
  KwAsync,
  KwAwait,
  KwGuard,
  KwInterface,
  KwDerive,
  KwPub,
  KwMut,
  KwServer,
  KwClient,
  KwShared,
  KwRoute,
  KwState,
  KwComputed,
  KwEffect,
  KwComponent,
  KwStore,

  // Punctuation / operators
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  Semicolon,
  Dot,
  DotDot,       // ..
  DotDotEq,     // ..=
  Ellipsis,     // ...
  At,

  Question,          // ?
  QuestionDot,       // ?.
  QuestionQuestion,  // ??
  Arrow,             // ->
  FatArrow,          // =>
  PipeGt,            // |>

  Plus,
  Minus,
  Star,
  StarStar,
  Slash,
  Percent,

  Bang,
  AndAnd,
  OrOr,

  Eq,
  EqEq,
  BangEq,
  Lt,
  Le,
  Gt,
  Ge,

  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
};

struct TemplatePart;

struct Token
{
  TokenKind kind = TokenKind::Eof;
  SourceRange range;      // byte range in the source (including quotes for strings)
  std::string_view text;  // raw lexeme
  std::string value;      // decoded payload (strings, JSX text, style body, doc text)
  uint32_t line = 0;      // 1-based
  uint32_t column = 0;    // 1-based
  std::vector<TemplatePart> parts;  // Template only

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

/**
 * One segment of an interpolated string. Text segments carry decoded text;
 * expression segments carry the tokens of the `{...}` run (Eof-terminated).
 */
struct TemplatePart
{
  bool is_expr = false;
  std::string text;
  std::vector<Token> tokens;
  SourceRange range;
};

[[nodiscard]] constexpr bool is_keyword(TokenKind k) noexcept
{
  return k >= TokenKind::KwVar && k <= TokenKind::KwStore;
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Number:
      return "number";
    case TokenKind::String:
      return "string";
    case TokenKind::Template:
      return "template string";
    case TokenKind::DocComment:
      return "doc comment";
    case TokenKind::JsxText:
      return "JSX text";
    case TokenKind::JsxTagOpen:
      return "'<'";
    case TokenKind::StyleBlock:
      return "style block";
    case TokenKind::KwVar:
      return "'var'";
    case TokenKind::KwLet:
      return "'let'";
    case TokenKind::KwFn:
      return "'fn'";
    case TokenKind::KwReturn:
      return "'return'";
    case TokenKind::KwIf:
      return "'if'";
    case TokenKind::KwElif:
      return "'elif'";
    case TokenKind::KwElse:
      return "'else'";
    case TokenKind::KwFor:
      return "'for'";
    case TokenKind::KwWhile:
      return "'while'";
    case TokenKind::KwMatch:
      return "'match'";
    case TokenKind::KwType:
      return "'type'";
    case TokenKind::KwImport:
      return "'import'";
    case TokenKind::KwFrom:
      return "'from'";
    case TokenKind::KwExport:
      return "'export'";
    case TokenKind::KwAs:
      return "'as'";
    case TokenKind::KwAnd:
      return "'and'";
    case TokenKind::KwOr:
      return "'or'";
    case TokenKind::KwNot:
      return "'not'";
    case TokenKind::KwIn:
      return "'in'";
    case TokenKind::KwTrue:
      return "'true'";
    case TokenKind::KwFalse:
      return "'false'";
    case TokenKind::KwNil:
      return "'nil'";
    case TokenKind::KwBreak:
      return "'break'";
    case TokenKind::KwContinue:
      return "'continue'";
    case TokenKind::KwTry:
      return "'try'";
    case TokenKind::KwCatch:
      return "'catch'";
    case TokenKind::KwFinally:
      return "'finally'";
    case TokenKind::KwAsync:
      return "'async'";
    case TokenKind::KwAwait:
      return "'await'";
    case TokenKind::KwGuard:
      return "'guard'";
    case TokenKind::KwInterface:
      return "'interface'";
    case TokenKind::KwDerive:
      return "'derive'";
    case TokenKind::KwPub:
      return "'pub'";
    case TokenKind::KwMut:
      return "'mut'";
    case TokenKind::KwServer:
      return "'server'";
    case TokenKind::KwClient:
      return "'client'";
    case TokenKind::KwShared:
      return "'shared'";
    case TokenKind::KwRoute:
      return "'route'";
    case TokenKind::KwState:
      return "'state'";
    case TokenKind::KwComputed:
      return "'computed'";
    case TokenKind::KwEffect:
      return "'effect'";
    case TokenKind::KwComponent:
      return "'component'";
    case TokenKind::KwStore:
      return "'store'";
    case TokenKind::LParen:
      return "'('";
    case TokenKind::RParen:
      return "')'";
    case TokenKind::LBrace:
      return "'{'";
    case TokenKind::RBrace:
      return "'}'";
    case TokenKind::LBracket:
      return "'['";
    case TokenKind::RBracket:
      return "']'";
    case TokenKind::Comma:
      return "','";
    case TokenKind::Colon:
      return "':'";
    case TokenKind::Semicolon:
      return "';'";
    case TokenKind::Dot:
      return "'.'";
    case TokenKind::DotDot:
      return "'..'";
    case TokenKind::DotDotEq:
      return "'..='";
    case TokenKind::Ellipsis:
      return "'...'";
    case TokenKind::At:
      return "'@'";
    case TokenKind::Question:
      return "'?'";
    case TokenKind::QuestionDot:
      return "'?.'";
    case TokenKind::QuestionQuestion:
      return "'??'";
    case TokenKind::Arrow:
      return "'->'";
    case TokenKind::FatArrow:
      return "'=>'";
    case TokenKind::PipeGt:
      return "'|>'";
    case TokenKind::Plus:
      return "'+'";
    case TokenKind::Minus:
      return "'-'";
    case TokenKind::Star:
      return "'*'";
    case TokenKind::StarStar:
      return "'**'";
    case TokenKind::Slash:
      return "'/'";
    case TokenKind::Percent:
      return "'%'";
    case TokenKind::Bang:
      return "'!'";
    case TokenKind::AndAnd:
      return "'&&'";
    case TokenKind::OrOr:
      return "'||'";
    case TokenKind::Eq:
      return "'='";
    case TokenKind::EqEq:
      return "'=='";
    case TokenKind::BangEq:
      return "'!='";
    case TokenKind::Lt:
      return "'<'";
    case TokenKind::Le:
      return "'<='";
    case TokenKind::Gt:
      return "'>'";
    case TokenKind::Ge:
      return "'>='";
    case TokenKind::PlusEq:
      return "'+='";
    case TokenKind::MinusEq:
      return "'-='";
    case TokenKind::StarEq:
      return "'*='";
    case TokenKind::SlashEq:
      return "'/='";
  }
  return "<unknown>";
}

}  // namespace tova::syntax
