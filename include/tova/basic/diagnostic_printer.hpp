// tova/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "tova/basic/diagnostic.hpp"
#include "tova/basic/source_manager.hpp"

namespace tova
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E100]: Type mismatch: 'a' expects Int, but got String
 *     --> app.tova:4:3
 *      |
 *    4 | f("5")
 *      |   ^^^
 *      |
 *      = help: try toInt(value) to parse
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print one diagnostic. The source snippet is taken from `sources`.
  void print(const Diagnostic & diag, const SourceManager & sources);

  /// Print all diagnostics of a bag, ordered by location.
  void print_all(const DiagnosticBag & diags, const SourceManager & sources);

  /// One-line summary ("2 errors, 1 warning emitted").
  void print_summary(size_t errors, size_t warnings);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_label_context(const Label & label, const SourceManager & sources);

  void print_source_line(
    const SourceManager & sources, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    LabelStyle style, std::string_view label_message);

  void print_fixit(const FixIt & fixit, const SourceManager & sources);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace tova
