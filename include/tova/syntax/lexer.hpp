// tova/syntax/lexer.hpp - Mode-sensitive tokenizer
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "tova/basic/source_manager.hpp"
#include "tova/syntax/token.hpp"

namespace tova::syntax
{

/**
 * Converts source text into tokens.
 *
 * The lexer keeps a mode stack so that JSX markup, `{expr}` holes inside
 * markup and JSX control-flow heads are tokenized differently from ordinary
 * code. Malformed constructs throw LexError immediately.
 *
 * A lexer may also run over a sub-range of the source; string interpolation
 * uses that to tokenize each `{expr}` hole with absolute offsets.
 */
class Lexer
{
public:
  explicit Lexer(const SourceManager & sm);
  Lexer(const SourceManager & sm, size_t begin, size_t end);

  /// Tokenize everything; the last token is always Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  enum class Mode : uint8_t {
    Normal,        // ordinary code
    JsxTag,        // between '<' and '>'
    JsxChildren,   // text and children of an element or control body
    JsxControlHead // `if cond` / `for x in xs` head before its body '{'
  };

  struct ModeFrame
  {
    Mode mode = Mode::Normal;
    int brace_depth = 0;
    bool pop_on_close = false;   // Normal: `{expr}` hole that ends at its '}'
    bool closing_tag = false;    // JsxTag: `</name>`
    bool control_body = false;   // JsxChildren: body of an `if`/`for` child
  };

  [[nodiscard]] bool next_token(Token & out);

  [[nodiscard]] bool eof() const noexcept { return pos_ >= end_; }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < end_) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_trivia();
  bool lex_doc_comment(Token & out);
  void skip_block_comment();

  [[nodiscard]] Token lex_identifier_or_keyword(bool allow_dash);
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_single_quoted();
  [[nodiscard]] Token lex_style_block(size_t start);
  [[nodiscard]] Token lex_operator();

  bool lex_jsx_children(Token & out);
  [[nodiscard]] bool at_control_keyword() const noexcept;
  [[nodiscard]] bool tag_open_allowed() const noexcept;
  [[nodiscard]] bool first_on_line(size_t offset) const noexcept;

  void after_emit(const Token & t);

  [[nodiscard]] Token make_token(TokenKind kind, size_t start, size_t end) const;

  [[noreturn]] void fail(
    size_t offset, std::string message, std::string_view code, std::string hint = "") const;

  const SourceManager & sm_;
  std::string_view src_;
  size_t pos_ = 0;
  size_t end_ = 0;
  std::vector<ModeFrame> modes_;
  bool has_last_ = false;
  TokenKind last_kind_ = TokenKind::Eof;
};

}  // namespace tova::syntax
