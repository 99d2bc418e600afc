// tova/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "tova/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace tova
{
namespace
{

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & sources)
{
  print_severity_header(diag);

  // --> file:line:col
  fmt::print(os_, "{} {}\n", gutter_arrow(), diag.location_string());
  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, sources);
  }
  for (const auto & f : diag.fixits) {
    print_fixit(f, sources);
  }
  if (diag.hint) {
    print_help(*diag.hint);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & sources)
{
  std::vector<Diagnostic> sorted(diags.begin(), diags.end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.primary_range().get_begin() < b.primary_range().get_begin();
  });

  for (const auto & d : sorted) {
    print(d, sources);
  }
}

void DiagnosticPrinter::print_summary(size_t errors, size_t warnings)
{
  if (errors == 0 && warnings == 0) {
    return;
  }
  const std::string text = fmt::format(
    "{} error{}, {} warning{} emitted", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::yellow) << text
        << rang::fg::reset << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", text);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  std::string_view severity_str = "error";
  rang::fg colour = rang::fg::red;
  switch (diag.severity) {
    case Severity::Error:
      break;
    case Severity::Warning:
      severity_str = "warning";
      colour = rang::fg::yellow;
      break;
    case Severity::Info:
      severity_str = "info";
      colour = rang::fg::cyan;
      break;
  }

  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);
  if (use_color_) {
    os_ << rang::style::bold << colour << severity_str << code << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}{}: {}\n", severity_str, code, diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceManager & sources)
{
  if (label.range.is_invalid()) {
    return;
  }

  const LineColumn begin = sources.get_line_column(label.range.get_begin());
  const LineColumn end = sources.get_line_column(label.range.get_end());
  if (!begin.is_valid()) {
    return;
  }

  const uint32_t end_col =
    (end.line == begin.line && end.column > begin.column) ? end.column : (begin.column + 1);
  print_source_line(sources, begin.line - 1, begin.column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceManager & sources, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = sources.get_line(line_index);
  if (line.empty()) {
    return;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_index + 1);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_index + 1);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  // Marker line; tabs were expanded to four columns above.
  std::string marker_prefix;
  for (size_t i = 0; i + 1 < start_col && i < line.size(); ++i) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }
  const size_t marker_len = std::max<size_t>(1, end_col - start_col);
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "      | {}", marker_prefix);
  if (use_color_) {
    os_ << (style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_fixit(const FixIt & fixit, const SourceManager & sources)
{
  const std::string_view original = sources.get_source_slice(fixit.range);
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::green << rang::style::bold << "   = " << rang::style::reset
        << rang::fg::reset;
  } else {
    fmt::print(os_, "   = ");
  }
  fmt::print(os_, "fix: replace '{}' with '{}'\n", original, fixit.replacement_text);
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return "\033[1;36m  -->\033[0m";
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return "\033[1;36m      |\033[0m";
  }
  return "      |";
}

}  // namespace tova
