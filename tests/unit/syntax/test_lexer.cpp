#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tova/basic/error_codes.hpp"
#include "tova/basic/errors.hpp"
#include "tova/basic/source_manager.hpp"
#include "tova/syntax/lexer.hpp"
#include "tova/syntax/token.hpp"

using tova::SourceManager;
using tova::syntax::Lexer;
using tova::syntax::Token;
using tova::syntax::TokenKind;

namespace
{

std::vector<Token> lex(const SourceManager & sm)
{
  Lexer lexer(sm);
  return lexer.lex_all();
}

std::vector<TokenKind> kinds(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) out.push_back(t.kind);
  return out;
}

}  // namespace

TEST(SyntaxLexer, RangeOperatorIsNotAFloat)
{
  const SourceManager sm("1..10");
  const auto toks = lex(sm);

  const std::vector<TokenKind> expected = {
    TokenKind::Number, TokenKind::DotDot, TokenKind::Number, TokenKind::Eof};
  EXPECT_EQ(kinds(toks), expected);
  EXPECT_EQ(toks[0].text, "1");
  EXPECT_EQ(toks[2].text, "10");
}

TEST(SyntaxLexer, InclusiveRangeAndFloat)
{
  const SourceManager sm("0..=2.5");
  const auto toks = lex(sm);

  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[1].kind, TokenKind::DotDotEq);
  EXPECT_EQ(toks[2].kind, TokenKind::Number);
  EXPECT_EQ(toks[2].text, "2.5");
}

TEST(SyntaxLexer, TokenTextMatchesSourceSlice)
{
  const SourceManager sm(
    "fn add(a, b) -> Int {\n"
    "  a + b\n"
    "}\n"
    "result = add(1, 2) |> double()\n");
  const auto toks = lex(sm);

  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Eof) continue;
    EXPECT_EQ(sm.get_source_slice(t.range), t.text);
  }
}

TEST(SyntaxLexer, LineAndColumnAreOneBased)
{
  const SourceManager sm("x = 1\n  y = 2");
  const auto toks = lex(sm);

  ASSERT_GE(toks.size(), 4U);
  EXPECT_EQ(toks[0].line, 1U);
  EXPECT_EQ(toks[0].column, 1U);
  EXPECT_EQ(toks[3].text, "y");
  EXPECT_EQ(toks[3].line, 2U);
  EXPECT_EQ(toks[3].column, 3U);
}

TEST(SyntaxLexer, KeywordsAndOperators)
{
  const SourceManager sm("var mut fn x ?? y?.z => |> ** !=");
  const auto toks = lex(sm);

  const std::vector<TokenKind> expected = {
    TokenKind::KwVar,       TokenKind::KwMut,      TokenKind::KwFn,
    TokenKind::Identifier,  TokenKind::QuestionQuestion, TokenKind::Identifier,
    TokenKind::QuestionDot, TokenKind::Identifier, TokenKind::FatArrow,
    TokenKind::PipeGt,      TokenKind::StarStar,   TokenKind::BangEq,
    TokenKind::Eof};
  EXPECT_EQ(kinds(toks), expected);
}

TEST(SyntaxLexer, LineCommentsAreSkippedButDocCommentsAreKept)
{
  const SourceManager sm(
    "// plain comment\n"
    "/// Adds two numbers\n"
    "fn add(a, b) { a + b }\n");
  const auto toks = lex(sm);

  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].kind, TokenKind::DocComment);
  EXPECT_EQ(toks[0].value, "Adds two numbers");
  EXPECT_EQ(toks[1].kind, TokenKind::KwFn);
}

TEST(SyntaxLexer, StringValueIsDecoded)
{
  const SourceManager sm(R"("a\tb\n")");
  const auto toks = lex(sm);

  ASSERT_EQ(toks.size(), 2U);
  EXPECT_EQ(toks[0].kind, TokenKind::String);
  EXPECT_EQ(toks[0].value, "a\tb\n");
  EXPECT_EQ(toks[0].text, R"("a\tb\n")");
}

TEST(SyntaxLexer, InterpolatedStringProducesTemplateParts)
{
  const SourceManager sm(R"("Hello, {name}!")");
  const auto toks = lex(sm);

  ASSERT_EQ(toks.size(), 2U);
  const Token & t = toks[0];
  ASSERT_EQ(t.kind, TokenKind::Template);
  ASSERT_EQ(t.parts.size(), 3U);

  EXPECT_FALSE(t.parts[0].is_expr);
  EXPECT_EQ(t.parts[0].text, "Hello, ");

  ASSERT_TRUE(t.parts[1].is_expr);
  ASSERT_EQ(t.parts[1].tokens.size(), 2U);
  EXPECT_EQ(t.parts[1].tokens[0].kind, TokenKind::Identifier);
  EXPECT_EQ(t.parts[1].tokens[0].text, "name");
  EXPECT_EQ(t.parts[1].tokens[1].kind, TokenKind::Eof);

  EXPECT_FALSE(t.parts[2].is_expr);
  EXPECT_EQ(t.parts[2].text, "!");
}

TEST(SyntaxLexer, UnterminatedStringThrows)
{
  const SourceManager sm("x = \"never closed");
  try {
    (void)lex(sm);
    FAIL() << "expected LexError";
  } catch (const tova::LexError & e) {
    EXPECT_EQ(e.diagnostic().code, tova::error_codes::k_unterminated_string);
    EXPECT_EQ(e.diagnostic().line, 1U);
  }
}

TEST(SyntaxLexer, UnexpectedCharacterThrows)
{
  const SourceManager sm("a & b");
  try {
    (void)lex(sm);
    FAIL() << "expected LexError";
  } catch (const tova::LexError & e) {
    EXPECT_NE(e.diagnostic().message.find("Unexpected character '&'"), std::string::npos);
  }
}
