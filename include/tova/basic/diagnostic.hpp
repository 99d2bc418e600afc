// tova/basic/diagnostic.hpp - Diagnostic types for lexing/parsing/analysis
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tova/basic/source_manager.hpp"

namespace tova
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

enum class LabelStyle {
  Primary,    // direct cause
  Secondary,  // related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

/**
 * A located message produced by any compiler phase.
 *
 * `file`, `line` and `column` are resolved from the primary label when the
 * diagnostic is reported through a DiagnosticBag bound to a SourceManager.
 * Columns are 1-based.
 */
struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "E100"
  std::string message;

  std::string file;
  uint32_t line = 0;
  uint32_t column = 0;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> hint;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;

  /// "file:line:col" (or just the file label when unlocated)
  [[nodiscard]] std::string location_string() const;
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that registers its diagnostic in the bag on destruction (RAII).
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);

  DiagnosticBuilder & with_hint(std::string hint);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  /// Bag that resolves file/line/column of reported ranges through `sm`.
  explicit DiagnosticBag(const SourceManager * sm) : sm_(sm) {}

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string label_message = "");

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> errors() const;
  [[nodiscard]] std::vector<Diagnostic> warnings() const;
  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_warnings() const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder start(Severity severity, SourceRange range, std::string message,
                          std::string label_message);

  const SourceManager * sm_ = nullptr;
  std::vector<Diagnostic> diagnostics_;
};

/// Build a located diagnostic outside of a bag (lexer and parser errors).
[[nodiscard]] Diagnostic make_diagnostic(
  const SourceManager & sm, Severity severity, SourceRange range, std::string message,
  std::string code = "", std::optional<std::string> hint = std::nullopt);

}  // namespace tova
