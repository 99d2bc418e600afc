// tova/basic/errors.hpp - Exception taxonomy of the compiler phases
//
// LexError and ParseError are thrown at the first malformed construct.
// AnalysisError aggregates every error of one analyzer walk.
// CodegenError reports an internal defect and is deliberately not a
// CompileError.
//
#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "tova/basic/diagnostic.hpp"

namespace tova
{

/**
 * Base of all user-input failures. Carries the primary diagnostic.
 */
class CompileError : public std::runtime_error
{
public:
  explicit CompileError(Diagnostic diag);
  CompileError(const std::string & what, Diagnostic diag);

  [[nodiscard]] const Diagnostic & diagnostic() const noexcept { return diag_; }

  [[nodiscard]] uint32_t line() const noexcept { return diag_.line; }
  [[nodiscard]] uint32_t column() const noexcept { return diag_.column; }
  [[nodiscard]] const std::string & file() const noexcept { return diag_.file; }
  [[nodiscard]] const std::optional<std::string> & hint() const noexcept { return diag_.hint; }

private:
  Diagnostic diag_;
};

class LexError : public CompileError
{
public:
  using CompileError::CompileError;
};

class ParseError : public CompileError
{
public:
  using CompileError::CompileError;
};

/**
 * Aggregate of all analyzer errors, plus the warnings collected alongside.
 *
 * what() is "Analysis errors:" followed by one "  file:line:col: msg" line
 * per error.
 */
class AnalysisError : public CompileError
{
public:
  AnalysisError(std::vector<Diagnostic> errors, std::vector<Diagnostic> warnings);

  [[nodiscard]] const std::vector<Diagnostic> & errors() const noexcept { return errors_; }
  [[nodiscard]] const std::vector<Diagnostic> & warnings() const noexcept { return warnings_; }

private:
  std::vector<Diagnostic> errors_;
  std::vector<Diagnostic> warnings_;
};

/**
 * Internal defect in the code generator (e.g. a node kind without lowering).
 */
class CodegenError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

}  // namespace tova
