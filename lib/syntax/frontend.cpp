// tova/syntax/frontend.cpp - High-level parse pipeline
#include "tova/syntax/frontend.hpp"

#include <utility>

#include "tova/syntax/lexer.hpp"
#include "tova/syntax/parser.hpp"

namespace tova
{

std::unique_ptr<ParsedUnit> parse_source(
  std::string source_text, const std::filesystem::path & label)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = label.empty() ? SourceManager(std::move(source_text))
                               : SourceManager(label, std::move(source_text));

  syntax::Lexer lexer(unit->source);
  syntax::Parser parser(unit->ast, unit->source, lexer.lex_all());
  unit->program = parser.parse_program();
  return unit;
}

}  // namespace tova
