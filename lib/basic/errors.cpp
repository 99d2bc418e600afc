// tova/basic/errors.cpp - Exception message formatting
#include "tova/basic/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace tova
{
namespace
{

std::string located_message(const Diagnostic & d)
{
  if (d.line == 0) {
    return d.message;
  }
  return fmt::format("{}:{}:{}: {}", d.file, d.line, d.column, d.message);
}

std::string aggregate_message(const std::vector<Diagnostic> & errors)
{
  std::string out = "Analysis errors:";
  for (const auto & e : errors) {
    out += fmt::format("\n  {}:{}:{}: {}", e.file, e.line, e.column, e.message);
  }
  return out;
}

Diagnostic first_or_empty(const std::vector<Diagnostic> & errors)
{
  return errors.empty() ? Diagnostic{} : errors.front();
}

}  // namespace

CompileError::CompileError(Diagnostic diag)
: std::runtime_error(located_message(diag)), diag_(std::move(diag))
{
}

CompileError::CompileError(const std::string & what, Diagnostic diag)
: std::runtime_error(what), diag_(std::move(diag))
{
}

AnalysisError::AnalysisError(std::vector<Diagnostic> errors, std::vector<Diagnostic> warnings)
: CompileError(aggregate_message(errors), first_or_empty(errors)),
  errors_(std::move(errors)),
  warnings_(std::move(warnings))
{
}

}  // namespace tova
