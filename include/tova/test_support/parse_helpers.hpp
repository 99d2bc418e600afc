// tova/test_support/parse_helpers.hpp - helpers for unit tests
//
// These helpers run the single-file pipeline (parse, analyze, generate)
// and keep every stage's owner alive in one struct, so AST nodes and the
// types they point to stay valid for the whole test.
//
#pragma once

#include <algorithm>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tova/basic/diagnostic.hpp"
#include "tova/codegen/code_generator.hpp"
#include "tova/sema/analyzer.hpp"
#include "tova/syntax/frontend.hpp"

namespace tova::test_support
{

[[nodiscard]] inline bool any_message_contains(
  const std::vector<Diagnostic> & diags, std::string_view needle)
{
  return std::any_of(diags.begin(), diags.end(), [&](const Diagnostic & d) {
    return d.message.find(needle) != std::string::npos;
  });
}

[[nodiscard]] inline std::unique_ptr<ParsedUnit> parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.tova")
{
  return parse_source(std::move(src), virtual_path);
}

struct AnalyzedUnit
{
  std::unique_ptr<ParsedUnit> parsed;
  std::unique_ptr<Analyzer> analyzer;
  AnalysisResult result;

  [[nodiscard]] bool has_error(std::string_view needle) const
  {
    return any_message_contains(result.errors, needle);
  }

  [[nodiscard]] bool has_warning(std::string_view needle) const
  {
    return any_message_contains(result.warnings, needle);
  }

  [[nodiscard]] bool has_code(std::string_view code) const
  {
    const auto match = [&](const Diagnostic & d) { return d.code == code; };
    return std::any_of(result.errors.begin(), result.errors.end(), match) ||
           std::any_of(result.warnings.begin(), result.warnings.end(), match);
  }
};

/**
 * Parse and analyze `src`. Tolerant by default so tests can inspect
 * errors without catching AnalysisError.
 */
[[nodiscard]] inline AnalyzedUnit analyze(std::string src, AnalyzerOptions options = {true, false})
{
  AnalyzedUnit out;
  out.parsed = parse(std::move(src));
  out.analyzer = std::make_unique<Analyzer>(out.parsed->source, options);
  out.result = out.analyzer->analyze(out.parsed->program);
  return out;
}

struct CompiledUnit
{
  AnalyzedUnit analyzed;
  codegen::GenerateResult output;
};

/// Full pipeline. Analysis errors throw AnalysisError.
[[nodiscard]] inline CompiledUnit compile(std::string src, codegen::CodegenOptions options = {})
{
  CompiledUnit out;
  out.analyzed = analyze(std::move(src), AnalyzerOptions{});
  codegen::CodeGenerator generator(out.analyzed.parsed->source, options);
  out.output = generator.generate(*out.analyzed.parsed->program);
  return out;
}

/// Number of non-overlapping occurrences of `needle` in `haystack`.
[[nodiscard]] inline size_t count_occurrences(std::string_view haystack, std::string_view needle)
{
  if (needle.empty()) return 0;
  size_t n = 0;
  for (size_t pos = haystack.find(needle); pos != std::string_view::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

}  // namespace tova::test_support
