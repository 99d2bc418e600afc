// tova/syntax/lexer.cpp - Mode-sensitive tokenizer
#include "tova/syntax/lexer.hpp"

#include <algorithm>
#include <cctype>

#include "tova/basic/diagnostic.hpp"
#include "tova/basic/error_codes.hpp"
#include "tova/basic/errors.hpp"
#include "tova/syntax/keywords.hpp"

namespace tova::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

bool is_digit_for_base(unsigned char c, int base)
{
  switch (base) {
    case 16:
      return std::isxdigit(c) != 0;
    case 8:
      return c >= '0' && c <= '7';
    case 2:
      return c == '0' || c == '1';
    default:
      return std::isdigit(c) != 0;
  }
}

// Tokens after which '<' compares instead of opening a tag.
bool ends_value(TokenKind k)
{
  switch (k) {
    case TokenKind::Identifier:
    case TokenKind::Number:
    case TokenKind::String:
    case TokenKind::Template:
    case TokenKind::KwTrue:
    case TokenKind::KwFalse:
    case TokenKind::KwNil:
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
      return true;
    default:
      return false;
  }
}

// Whitespace runs collapse to one space; runs that contain a newline vanish
// at the edges of the text.
std::string collapse_jsx_text(std::string_view raw)
{
  std::string out;
  bool pending_space = false;
  bool run_has_newline = false;
  bool any = false;
  for (const char c : raw) {
    if (is_space(c)) {
      pending_space = true;
      run_has_newline = run_has_newline || c == '\n';
      continue;
    }
    if (pending_space && (any || !run_has_newline)) {
      out += ' ';
    }
    out += c;
    any = true;
    pending_space = false;
    run_has_newline = false;
  }
  if (pending_space && any && !run_has_newline) {
    out += ' ';
  }
  return any ? out : std::string();
}

std::string strip_underscores(std::string_view s)
{
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    if (c != '_') out += c;
  }
  return out;
}

}  // namespace

Lexer::Lexer(const SourceManager & sm) : Lexer(sm, 0, sm.size()) {}

Lexer::Lexer(const SourceManager & sm, size_t begin, size_t end)
: sm_(sm), src_(sm.get_source()), pos_(begin), end_(std::min(end, sm.size()))
{
  modes_.push_back(ModeFrame{});
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> tokens;
  Token t;
  while (next_token(t)) {
    after_emit(t);
    tokens.push_back(std::move(t));
    t = Token{};
  }
  if (modes_.size() > 1) {
    fail(
      end_ > 0 ? end_ - 1 : 0, "Unterminated JSX element", error_codes::k_expected_closing,
      "Close every element with a matching '</tag>' or use '/>'");
  }
  tokens.push_back(make_token(TokenKind::Eof, end_, end_));
  return tokens;
}

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return end_ >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make_token(TokenKind kind, size_t start, size_t end) const
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(static_cast<uint32_t>(start), static_cast<uint32_t>(end));
  t.text = src_.substr(start, end - start);
  const LineColumn lc = sm_.get_line_column(static_cast<uint32_t>(start));
  t.line = lc.line;
  t.column = lc.column;
  return t;
}

void Lexer::fail(size_t offset, std::string message, std::string_view code, std::string hint) const
{
  const auto at = static_cast<uint32_t>(offset);
  std::optional<std::string> h;
  if (!hint.empty()) {
    h = std::move(hint);
  }
  throw LexError(make_diagnostic(
    sm_, Severity::Error, SourceRange(at, at + 1), std::move(message), std::string(code),
    std::move(h)));
}

void Lexer::after_emit(const Token & t)
{
  if (t.kind == TokenKind::DocComment) {
    return;
  }
  has_last_ = true;
  last_kind_ = t.kind;
}

bool Lexer::tag_open_allowed() const noexcept { return !has_last_ || !ends_value(last_kind_); }

bool Lexer::first_on_line(size_t offset) const noexcept
{
  while (offset > 0) {
    const char c = src_[offset - 1];
    if (c == '\n') {
      return true;
    }
    if (c != ' ' && c != '\t' && c != '\r') {
      return false;
    }
    --offset;
  }
  return true;
}

// ============================================================================
// Trivia
// ============================================================================

void Lexer::skip_block_comment()
{
  const size_t start = pos_;
  int depth = 0;
  while (!eof()) {
    if (starts_with("/*")) {
      ++depth;
      advance(2);
      continue;
    }
    if (starts_with("*/")) {
      --depth;
      advance(2);
      if (depth == 0) {
        return;
      }
      continue;
    }
    advance(1);
  }
  fail(start, "Unterminated comment", error_codes::k_unterminated_comment, "Add a closing '*/'");
}

bool Lexer::lex_doc_comment(Token & out)
{
  const size_t start = pos_;
  advance(3);
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  std::string_view body = src_.substr(start + 3, pos_ - start - 3);
  while (!body.empty() && is_space(body.front())) body.remove_prefix(1);
  while (!body.empty() && is_space(body.back())) body.remove_suffix(1);

  out = make_token(TokenKind::DocComment, start, pos_);
  out.value = std::string(body);
  return true;
}

void Lexer::skip_trivia()
{
  while (!eof()) {
    if (is_space(peek())) {
      advance(1);
      continue;
    }
    if (starts_with("///")) {
      return;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    if (starts_with("/*")) {
      skip_block_comment();
      continue;
    }
    return;
  }
}

// ============================================================================
// Token scanners
// ============================================================================

Token Lexer::lex_identifier_or_keyword(bool allow_dash)
{
  const size_t start = pos_;
  advance(1);
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (is_ident_continue(c) ||
        (allow_dash && c == '-' && is_ident_start(static_cast<unsigned char>(peek(1))))) {
      advance(1);
      continue;
    }
    break;
  }

  Token t = make_token(TokenKind::Identifier, start, pos_);
  if (!allow_dash) {
    if (auto kw = lookup_keyword(t.text)) {
      t.kind = *kw;
    }
  }
  t.value = std::string(t.text);
  return t;
}

Token Lexer::lex_number()
{
  const size_t start = pos_;

  if (peek() == '0') {
    const char p1 = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
    if (p1 == 'x' || p1 == 'b' || p1 == 'o') {
      const int base = (p1 == 'x') ? 16 : (p1 == 'b') ? 2 : 8;
      advance(2);
      bool any = false;
      while (!eof()) {
        const auto c = static_cast<unsigned char>(peek());
        if (is_digit_for_base(c, base)) {
          any = true;
          advance(1);
        } else if (c == '_') {
          advance(1);
        } else {
          break;
        }
      }
      if (!any || (!eof() && std::isalnum(static_cast<unsigned char>(peek())) != 0)) {
        fail(start, "Invalid number literal", error_codes::k_invalid_number);
      }
      Token t = make_token(TokenKind::Number, start, pos_);
      t.value = strip_underscores(t.text);
      return t;
    }
  }

  auto digits = [this]() {
    while (!eof() && (std::isdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '_')) {
      advance(1);
    }
  };

  digits();

  // A '.' belongs to the number only when a digit follows, so `1..10` is a range.
  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    advance(1);
    digits();
  }

  if (peek() == 'e' || peek() == 'E') {
    const char sign = peek(1);
    const size_t digit_at = (sign == '+' || sign == '-') ? 2 : 1;
    if (std::isdigit(static_cast<unsigned char>(peek(digit_at))) != 0) {
      advance(digit_at);
      digits();
    }
  }

  Token t = make_token(TokenKind::Number, start, pos_);
  t.value = strip_underscores(t.text);
  return t;
}

namespace
{

// Decodes one escape sequence; `e` is the character after the backslash.
void append_escape(std::string & out, char e)
{
  switch (e) {
    case 'n':
      out += '\n';
      break;
    case 't':
      out += '\t';
      break;
    case 'r':
      out += '\r';
      break;
    case '0':
      out += '\0';
      break;
    case '\\':
    case '"':
    case '\'':
    case '{':
    case '}':
    case '$':
      out += e;
      break;
    default:
      out += '\\';
      out += e;
      break;
  }
}

}  // namespace

Token Lexer::lex_string()
{
  const size_t start = pos_;
  advance(1);

  std::vector<TemplatePart> parts;
  std::string buf;
  size_t text_start = pos_;
  bool has_interpolation = false;

  while (true) {
    if (eof()) {
      fail(start, "Unterminated string", error_codes::k_unterminated_string, "Add a closing '\"'");
    }
    const char c = peek();
    if (c == '"') {
      break;
    }
    if (c == '\\') {
      advance(1);
      if (eof()) {
        fail(start, "Unterminated string", error_codes::k_unterminated_string);
      }
      append_escape(buf, peek());
      advance(1);
      continue;
    }
    if (c != '{') {
      buf += c;
      advance(1);
      continue;
    }

    // Interpolation hole: find the matching '}' while skipping nested strings.
    has_interpolation = true;
    if (!buf.empty()) {
      TemplatePart text;
      text.text = std::move(buf);
      text.range = SourceRange(static_cast<uint32_t>(text_start), static_cast<uint32_t>(pos_));
      parts.push_back(std::move(text));
      buf.clear();
    }

    const size_t open = pos_;
    advance(1);
    const size_t expr_start = pos_;
    int depth = 1;
    while (true) {
      if (eof()) {
        fail(
          open, "Unterminated string interpolation", error_codes::k_unterminated_string,
          "Close the interpolation with '}'");
      }
      const char d = peek();
      if (d == '"' || d == '\'') {
        advance(1);
        while (!eof() && peek() != d) {
          if (peek() == '\\') advance(1);
          advance(1);
        }
        if (eof()) {
          fail(open, "Unterminated string interpolation", error_codes::k_unterminated_string);
        }
        advance(1);
        continue;
      }
      if (d == '{') {
        ++depth;
      } else if (d == '}') {
        if (--depth == 0) break;
      }
      advance(1);
    }
    const size_t expr_end = pos_;
    advance(1);

    TemplatePart part;
    part.is_expr = true;
    part.text = std::string(src_.substr(expr_start, expr_end - expr_start));
    part.range = SourceRange(static_cast<uint32_t>(expr_start), static_cast<uint32_t>(expr_end));
    Lexer sub(sm_, expr_start, expr_end);
    part.tokens = sub.lex_all();
    if (part.tokens.size() == 1) {
      fail(open, "Empty string interpolation", error_codes::k_expected_expression);
    }
    parts.push_back(std::move(part));
    text_start = pos_;
  }

  advance(1);  // closing quote

  if (!has_interpolation) {
    Token t = make_token(TokenKind::String, start, pos_);
    t.value = std::move(buf);
    return t;
  }

  if (!buf.empty()) {
    TemplatePart text;
    text.text = std::move(buf);
    text.range =
      SourceRange(static_cast<uint32_t>(text_start), static_cast<uint32_t>(pos_ - 1));
    parts.push_back(std::move(text));
  }
  Token t = make_token(TokenKind::Template, start, pos_);
  t.parts = std::move(parts);
  return t;
}

Token Lexer::lex_single_quoted()
{
  const size_t start = pos_;
  advance(1);
  std::string buf;
  while (true) {
    if (eof()) {
      fail(start, "Unterminated string", error_codes::k_unterminated_string, "Add a closing \"'\"");
    }
    const char c = peek();
    if (c == '\'') {
      break;
    }
    if (c == '\\') {
      advance(1);
      if (eof()) {
        fail(start, "Unterminated string", error_codes::k_unterminated_string);
      }
      append_escape(buf, peek());
      advance(1);
      continue;
    }
    buf += c;
    advance(1);
  }
  advance(1);
  Token t = make_token(TokenKind::String, start, pos_);
  t.value = std::move(buf);
  return t;
}

Token Lexer::lex_style_block(size_t start)
{
  while (!eof() && is_space(peek())) {
    advance(1);
  }
  const size_t open = pos_;
  advance(1);  // '{'
  const size_t body_start = pos_;
  int depth = 1;
  while (true) {
    if (eof()) {
      fail(open, "Unterminated style block", error_codes::k_expected_closing, "Add a closing '}'");
    }
    if (starts_with("/*")) {
      advance(2);
      while (!eof() && !starts_with("*/")) advance(1);
      if (eof()) {
        fail(open, "Unterminated comment", error_codes::k_unterminated_comment);
      }
      advance(2);
      continue;
    }
    const char c = peek();
    if (c == '"' || c == '\'') {
      advance(1);
      while (!eof() && peek() != c) advance(1);
      advance(1);
      continue;
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      if (--depth == 0) break;
    }
    advance(1);
  }
  const size_t body_end = pos_;
  advance(1);

  Token t = make_token(TokenKind::StyleBlock, start, pos_);
  t.value = std::string(src_.substr(body_start, body_end - body_start));
  return t;
}

Token Lexer::lex_operator()
{
  const size_t start = pos_;
  for (const auto & [spelling, kind] : k_operators) {
    if (starts_with(spelling)) {
      advance(spelling.size());
      return make_token(kind, start, pos_);
    }
  }
  if (peek() == '>') {
    advance(1);
    return make_token(TokenKind::Gt, start, pos_);
  }

  const char c = peek();
  if (c == '&') {
    fail(
      start, "Unexpected character '&'", error_codes::k_invalid_operator,
      "Use '&&' or 'and' for logical and");
  }
  if (c == '|') {
    fail(
      start, "Unexpected character '|'", error_codes::k_invalid_operator,
      "Use '||' or 'or' for logical or, or '|>' to pipe");
  }
  fail(
    start, std::string("Unexpected character '") + c + "'",
    error_codes::k_unexpected_character);
}

// ============================================================================
// JSX
// ============================================================================

bool Lexer::at_control_keyword() const noexcept
{
  auto word_at = [this](size_t p) {
    size_t q = p;
    while (q < end_ && is_ident_continue(static_cast<unsigned char>(src_[q]))) ++q;
    return src_.substr(p, q - p);
  };

  const std::string_view word = word_at(pos_);
  if (std::find(k_jsx_control_keywords.begin(), k_jsx_control_keywords.end(), word) ==
      k_jsx_control_keywords.end()) {
    return false;
  }

  // The rest of the line must open a body, otherwise this is plain text.
  size_t q = pos_ + word.size();
  const size_t line_end = std::min(end_, src_.find('\n', q) == std::string_view::npos
                                           ? end_
                                           : src_.find('\n', q));
  const std::string_view rest = src_.substr(q, line_end - q);
  const size_t brace = rest.find('{');
  if (brace == std::string_view::npos) {
    return false;
  }
  if (rest.substr(0, brace).find('<') != std::string_view::npos) {
    return false;
  }
  if (word == "else") {
    while (q < line_end && is_space(src_[q])) ++q;
    return q < line_end && (src_[q] == '{' || word_at(q) == "if");
  }
  if (word == "for") {
    return rest.find(" in ") != std::string_view::npos;
  }
  return true;
}

bool Lexer::lex_jsx_children(Token & out)
{
  const bool control_body = modes_.back().control_body;
  const size_t start = pos_;
  while (!eof() && is_space(peek())) {
    advance(1);
  }
  if (eof()) {
    return false;
  }

  const char c = peek();
  if (c == '<') {
    const bool closing = peek(1) == '/';
    out = make_token(TokenKind::JsxTagOpen, pos_, pos_ + 1);
    advance(1);
    ModeFrame tag;
    tag.mode = Mode::JsxTag;
    tag.closing_tag = closing;
    modes_.push_back(tag);
    return true;
  }
  if (c == '{') {
    out = make_token(TokenKind::LBrace, pos_, pos_ + 1);
    advance(1);
    ModeFrame hole;
    hole.pop_on_close = true;
    modes_.push_back(hole);
    return true;
  }
  if (c == '}') {
    if (!control_body) {
      fail(
        pos_, "Unexpected '}' in JSX text", error_codes::k_unexpected_token,
        "Write a literal brace as {\"}\"}");
    }
    out = make_token(TokenKind::RBrace, pos_, pos_ + 1);
    advance(1);
    modes_.pop_back();
    return true;
  }
  if (at_control_keyword()) {
    out = lex_identifier_or_keyword(false);
    ModeFrame head;
    head.mode = Mode::JsxControlHead;
    modes_.push_back(head);
    return true;
  }

  // Text run; a control keyword at the start of a later line ends it.
  pos_ = start;
  while (!eof()) {
    const char ch = peek();
    if (ch == '<' || ch == '{' || ch == '}') {
      break;
    }
    if (ch == '\n') {
      const size_t save = pos_;
      advance(1);
      while (!eof() && is_space(peek())) advance(1);
      const bool control = !eof() && at_control_keyword();
      pos_ = save;
      if (control) {
        break;
      }
    }
    advance(1);
  }

  std::string text = collapse_jsx_text(src_.substr(start, pos_ - start));
  if (text.empty()) {
    return false;
  }
  out = make_token(TokenKind::JsxText, start, pos_);
  out.value = std::move(text);
  return true;
}

// ============================================================================
// Dispatch
// ============================================================================

bool Lexer::next_token(Token & out)
{
  while (true) {
    if (modes_.back().mode == Mode::JsxChildren) {
      if (lex_jsx_children(out)) {
        return true;
      }
      if (eof()) {
        return false;
      }
      continue;
    }

    skip_trivia();
    if (eof()) {
      return false;
    }
    if (starts_with("///")) {
      return lex_doc_comment(out);
    }
    break;
  }

  const ModeFrame frame = modes_.back();
  const size_t start = pos_;
  const auto c = static_cast<unsigned char>(peek());

  if (frame.mode == Mode::JsxTag) {
    if (c == '>') {
      const bool self_closing = has_last_ && last_kind_ == TokenKind::Slash;
      out = make_token(TokenKind::Gt, start, start + 1);
      advance(1);
      modes_.pop_back();
      if (frame.closing_tag) {
        if (modes_.back().mode != Mode::JsxChildren || modes_.back().control_body) {
          fail(start, "Unexpected closing tag", error_codes::k_mismatched_jsx_tag);
        }
        modes_.pop_back();
      } else if (!self_closing) {
        ModeFrame children;
        children.mode = Mode::JsxChildren;
        modes_.push_back(children);
      }
      return true;
    }
    if (c == '{') {
      out = make_token(TokenKind::LBrace, start, start + 1);
      advance(1);
      ModeFrame hole;
      hole.pop_on_close = true;
      modes_.push_back(hole);
      return true;
    }
    if (is_ident_start(c)) {
      out = lex_identifier_or_keyword(true);
      return true;
    }
    if (c == '"') {
      out = lex_string();
      return true;
    }
    if (c == '\'') {
      out = lex_single_quoted();
      return true;
    }
    out = lex_operator();
    return true;
  }

  // Normal and control-head modes. A '<' that begins a line always opens
  // markup, so a component body may end with an element after a value.
  if (c == '<' && (tag_open_allowed() || first_on_line(start)) &&
      is_ident_start(static_cast<unsigned char>(peek(1)))) {
    out = make_token(TokenKind::JsxTagOpen, start, start + 1);
    advance(1);
    ModeFrame tag;
    tag.mode = Mode::JsxTag;
    modes_.push_back(tag);
    return true;
  }

  if (c == '{') {
    out = make_token(TokenKind::LBrace, start, start + 1);
    advance(1);
    ModeFrame & top = modes_.back();
    if (top.mode == Mode::JsxControlHead && top.brace_depth == 0 &&
        !(has_last_ && last_kind_ == TokenKind::Eq)) {
      modes_.pop_back();
      ModeFrame body;
      body.mode = Mode::JsxChildren;
      body.control_body = true;
      modes_.push_back(body);
    } else if (top.pop_on_close || top.mode == Mode::JsxControlHead) {
      ++top.brace_depth;
    }
    return true;
  }

  if (c == '}') {
    out = make_token(TokenKind::RBrace, start, start + 1);
    advance(1);
    ModeFrame & top = modes_.back();
    if (top.brace_depth > 0) {
      --top.brace_depth;
    } else if (top.pop_on_close) {
      modes_.pop_back();
    }
    return true;
  }

  if (is_ident_start(c)) {
    out = lex_identifier_or_keyword(false);
    if (out.text == "style") {
      size_t q = pos_;
      while (q < end_ && is_space(src_[q])) ++q;
      if (q < end_ && src_[q] == '{') {
        out = lex_style_block(start);
      }
    }
    return true;
  }
  if (std::isdigit(c) != 0) {
    out = lex_number();
    return true;
  }
  if (c == '"') {
    out = lex_string();
    return true;
  }
  if (c == '\'') {
    out = lex_single_quoted();
    return true;
  }
  out = lex_operator();
  return true;
}

}  // namespace tova::syntax
