// tova/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "tova/ast/ast.hpp"
#include "tova/ast/ast_context.hpp"
#include "tova/basic/source_manager.hpp"

namespace tova
{

/**
 * One parsed source file. The AST points into `ast` and is valid for the
 * lifetime of the unit.
 */
struct ParsedUnit
{
  SourceManager source;
  AstContext ast;
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST)
//
// Throws LexError / ParseError on the first malformed construct.
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_source(
  std::string source_text, const std::filesystem::path & label = {});

}  // namespace tova
