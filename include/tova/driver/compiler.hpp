// tova/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline (lex, parse, analyze,
// generate, write). Used by tovac and by the driver tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tova/basic/diagnostic.hpp"
#include "tova/basic/source_manager.hpp"
#include "tova/codegen/code_generator.hpp"
#include "tova/project/project_config.hpp"
#include "tova/sema/analyzer.hpp"

namespace tova
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Syntax and semantic analysis only (no codegen)
  Build,  ///< Full build including JavaScript generation
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  CompileMode mode = CompileMode::Build;

  /// Output directory for generated files (overrides project config).
  /// When unset, compile_file writes next to the source file.
  std::optional<std::filesystem::path> output_dir;

  /**
   * Analyzer flags. With `tolerant` set, analysis errors are reported but
   * do not stop code generation.
   */
  AnalyzerOptions analyzer;

  codegen::CodegenOptions codegen;

  /// Count warnings as errors when deciding success
  bool warnings_as_errors = false;

  /// Targets to write; empty means all of them
  std::vector<std::string> targets;

  /// Write output files (compile_file / compile_project only)
  bool write_files = true;

  /// Print progress to stderr
  bool verbose = false;
};

// ============================================================================
// Compile Result
// ============================================================================

/**
 * Outcome of compiling one source file.
 */
struct CompiledUnit
{
  SourceManager source;

  /// Lex, parse and analysis diagnostics located in `source`
  DiagnosticBag diagnostics;

  /// Generated code (Build mode, when the unit got that far)
  std::optional<codegen::GenerateResult> output;

  std::vector<std::filesystem::path> generated_files;
};

struct CompileResult
{
  /// Whether compilation succeeded (no errors)
  bool success = false;

  /// One entry per compiled source file
  std::vector<CompiledUnit> units;

  /// Driver-level errors without a source location (missing files, I/O)
  DiagnosticBag diagnostics;

  [[nodiscard]] size_t error_count() const;
  [[nodiscard]] size_t warning_count() const;

  static CompileResult ok(std::vector<CompiledUnit> units)
  {
    CompileResult r;
    r.units = std::move(units);
    r.success = true;
    return r;
  }

  static CompileResult fail(std::string message)
  {
    CompileResult r;
    r.diagnostics.report_error(SourceRange{}, std::move(message));
    r.success = false;
    return r;
  }
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * The pipeline consists of:
 * 1. Lexing and parsing (LexError/ParseError stop the unit)
 * 2. Semantic analysis (errors and warnings are collected)
 * 3. Code generation (Build mode only)
 * 4. Writing one file per non-empty target
 *
 * CodegenError is not caught: it signals a compiler defect.
 */
class Compiler
{
public:
  /**
   * Compile source text held in memory. Nothing is written to disk.
   *
   * @param source Tova source text
   * @param label File label used in diagnostics
   */
  [[nodiscard]] static CompileResult compile_source(
    std::string source, const std::filesystem::path & label, const CompileOptions & options);

  /**
   * Compile a single source file.
   *
   * @param file Path to the .tova source file
   * @param options Compile options
   * @return CompileResult with success status and diagnostics
   */
  [[nodiscard]] static CompileResult compile_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Compile every entry point of a project. Options given on the command
   * line take precedence over the config file; boolean flags are combined.
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

  /// Output file name for one target of `stem` (`app` + `client` ->
  /// `app.client.js`). Modules write `<stem>.js`.
  [[nodiscard]] static std::string output_file_name(
    const std::string & stem, const std::string & target, bool is_module);

private:
  static CompiledUnit compile_unit(
    std::string source, const std::filesystem::path & label, const CompileOptions & options);

  static bool write_outputs(
    CompiledUnit & unit, const std::filesystem::path & output_dir, const std::string & stem,
    const CompileOptions & options, DiagnosticBag & diags);

  static bool unit_succeeded(const CompiledUnit & unit, const CompileOptions & options);
};

}  // namespace tova
