// tova/driver/compiler.cpp - Compiler driver implementation
//
#include "tova/driver/compiler.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

#include "tova/basic/errors.hpp"
#include "tova/syntax/frontend.hpp"

namespace tova
{

namespace
{

bool wants_target(const CompileOptions & options, std::string_view target)
{
  return options.targets.empty() ||
         std::find(options.targets.begin(), options.targets.end(), target) != options.targets.end();
}

bool write_text(const std::filesystem::path & path, const std::string & text, DiagnosticBag & diags)
{
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    diags.report_error(SourceRange{}, "cannot open output file: " + path.string());
    return false;
  }
  out << text;
  if (!out) {
    diags.report_error(SourceRange{}, "failed to write output file: " + path.string());
    return false;
  }
  return true;
}

bool read_text(const std::filesystem::path & path, std::string & out)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  out = buffer.str();
  return true;
}

void log_verbose(const CompileOptions & options, const std::string & message)
{
  if (options.verbose) std::cerr << fmt::format("tovac: {}\n", message);
}

}  // namespace

size_t CompileResult::error_count() const
{
  size_t n = diagnostics.errors().size();
  for (const auto & u : units) n += u.diagnostics.errors().size();
  return n;
}

size_t CompileResult::warning_count() const
{
  size_t n = diagnostics.warnings().size();
  for (const auto & u : units) n += u.diagnostics.warnings().size();
  return n;
}

std::string Compiler::output_file_name(
  const std::string & stem, const std::string & target, bool is_module)
{
  if (is_module && target == "shared") return stem + ".js";
  if (target == "deploy") return stem + ".deploy.json";
  return stem + "." + target + ".js";
}

CompiledUnit Compiler::compile_unit(
  std::string source, const std::filesystem::path & label, const CompileOptions & options)
{
  CompiledUnit unit;
  const std::string display = label.empty() ? std::string("<input>") : label.generic_string();

  // Parse
  std::unique_ptr<ParsedUnit> parsed;
  try {
    parsed = parse_source(source, label);
  } catch (const CompileError & e) {
    unit.source = SourceManager(label, std::move(source));
    unit.diagnostics.add(e.diagnostic());
    log_verbose(options, fmt::format("{}: syntax error", display));
    return unit;
  }
  unit.source = parsed->source;
  log_verbose(options, fmt::format("{}: parsed", display));

  // Analyze. The driver always collects, and decides below whether errors stop the unit.
  AnalyzerOptions analyzer_options = options.analyzer;
  analyzer_options.tolerant = true;
  Analyzer analyzer(parsed->source, analyzer_options);
  AnalysisResult analysis = analyzer.analyze(parsed->program);
  for (auto & d : analysis.errors) unit.diagnostics.add(std::move(d));
  for (auto & d : analysis.warnings) unit.diagnostics.add(std::move(d));
  log_verbose(
    options, fmt::format(
               "{}: analyzed ({} errors, {} warnings)", display, unit.diagnostics.errors().size(),
               unit.diagnostics.warnings().size()));

  if (options.mode == CompileMode::Check) return unit;
  if (unit.diagnostics.has_errors() && !options.analyzer.tolerant) return unit;

  // Generate
  codegen::CodeGenerator generator(parsed->source, options.codegen);
  unit.output = generator.generate(*parsed->program);
  log_verbose(options, fmt::format("{}: generated", display));
  return unit;
}

bool Compiler::unit_succeeded(const CompiledUnit & unit, const CompileOptions & options)
{
  if (options.mode == CompileMode::Build && !unit.output) return false;
  if (unit.diagnostics.has_errors() && !options.analyzer.tolerant) return false;
  if (options.warnings_as_errors && unit.diagnostics.has_warnings()) return false;
  return true;
}

bool Compiler::write_outputs(
  CompiledUnit & unit, const std::filesystem::path & output_dir, const std::string & stem,
  const CompileOptions & options, DiagnosticBag & diags)
{
  namespace fs = std::filesystem;

  if (!unit.output) return true;
  const codegen::GenerateResult & out = *unit.output;

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    diags.report_error(
      SourceRange{}, "cannot create output directory " + output_dir.string() + ": " + ec.message());
    return false;
  }

  std::vector<std::pair<std::string, const std::string *>> files;
  if (wants_target(options, "shared") && !out.shared.empty()) {
    files.emplace_back(output_file_name(stem, "shared", out.isModule), &out.shared);
  }
  if (wants_target(options, "client") && !out.client.empty()) {
    files.emplace_back(output_file_name(stem, "client", false), &out.client);
  }
  if (wants_target(options, "server") && !out.server.empty()) {
    files.emplace_back(output_file_name(stem, "server", false), &out.server);
  }
  if (wants_target(options, "edge")) {
    if (!out.edge.empty()) files.emplace_back(output_file_name(stem, "edge", false), &out.edge);
    for (const auto & [name, code] : out.edges) {
      files.emplace_back(output_file_name(stem, "edge." + name, false), &code);
    }
  }
  if (wants_target(options, "cli") && !out.cli.empty()) {
    files.emplace_back(output_file_name(stem, "cli", false), &out.cli);
  }

  bool ok = true;
  for (const auto & [name, text] : files) {
    const fs::path path = output_dir / name;
    if (!write_text(path, *text, diags)) {
      ok = false;
      continue;
    }
    unit.generated_files.push_back(path);
    log_verbose(options, "wrote " + path.generic_string());
  }

  if (wants_target(options, "deploy") && !out.deploy.empty()) {
    const fs::path path = output_dir / output_file_name(stem, "deploy", false);
    if (write_text(path, out.deploy.dump(2) + "\n", diags)) {
      unit.generated_files.push_back(path);
      log_verbose(options, "wrote " + path.generic_string());
    } else {
      ok = false;
    }
  }

  if (out.sourceMappings) {
    const fs::path path = output_dir / (stem + ".sourcemap.json");
    if (write_text(path, out.mappings_json().dump(2) + "\n", diags)) {
      unit.generated_files.push_back(path);
    } else {
      ok = false;
    }
  }
  return ok;
}

CompileResult Compiler::compile_source(
  std::string source, const std::filesystem::path & label, const CompileOptions & options)
{
  CompileResult result;
  result.units.push_back(compile_unit(std::move(source), label, options));
  result.success = unit_succeeded(result.units.back(), options);
  return result;
}

CompileResult Compiler::compile_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  namespace fs = std::filesystem;

  if (!fs::exists(file)) {
    return CompileResult::fail("file not found: " + file.string());
  }

  std::string source;
  if (!read_text(file, source)) {
    return CompileResult::fail("cannot read file: " + file.string());
  }

  CompileResult result;
  result.units.push_back(compile_unit(std::move(source), file, options));
  CompiledUnit & unit = result.units.back();
  result.success = unit_succeeded(unit, options);

  if (result.success && options.mode == CompileMode::Build && options.write_files) {
    const fs::path output_dir = options.output_dir.value_or(file.parent_path());
    if (!write_outputs(unit, output_dir, file.stem().string(), options, result.diagnostics)) {
      result.success = false;
    }
  }
  return result;
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  namespace fs = std::filesystem;

  if (config.build.entry_points.empty()) {
    return CompileResult::fail("no entry points defined in project configuration");
  }

  // Command-line flags win; the config file can only switch features on.
  CompileOptions effective = options;
  effective.analyzer.tolerant = options.analyzer.tolerant || config.analyzer.tolerant;
  effective.analyzer.strict = options.analyzer.strict || config.analyzer.strict;
  effective.warnings_as_errors = options.warnings_as_errors || config.analyzer.warnings_as_errors;
  effective.codegen.sourceMaps = options.codegen.sourceMaps || config.build.source_maps;
  if (effective.targets.empty()) effective.targets = config.build.targets;

  const fs::path output_dir =
    options.output_dir.value_or(config.project_root / config.build.output_dir);

  CompileResult result;
  result.success = true;
  for (const auto & entry_rel : config.build.entry_points) {
    const fs::path entry_path = config.project_root / entry_rel;

    std::string source;
    if (!fs::exists(entry_path) || !read_text(entry_path, source)) {
      result.diagnostics.report_error(
        SourceRange{}, "entry point not found: " + entry_path.string());
      result.success = false;
      continue;
    }

    log_verbose(effective, "compiling " + entry_path.generic_string());
    result.units.push_back(compile_unit(std::move(source), entry_path, effective));
    CompiledUnit & unit = result.units.back();
    if (!unit_succeeded(unit, effective)) {
      result.success = false;
      continue;
    }
    if (effective.mode == CompileMode::Build && effective.write_files) {
      if (!write_outputs(
            unit, output_dir, entry_path.stem().string(), effective, result.diagnostics)) {
        result.success = false;
      }
    }
  }
  return result;
}

}  // namespace tova
