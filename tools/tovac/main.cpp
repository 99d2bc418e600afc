// tovac - Tova Compiler Command Line Interface
//
// Usage:
//   tovac build [file.tova | project-dir] [-o output] [--tolerant] [--source-maps]
//   tovac check [file.tova | project-dir] [--strict]
//   tovac tokens <file.tova>
//   tovac ast <file.tova>
//   tovac init [dir]
//
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <rang.hpp>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "tova/ast/json_visitor.hpp"
#include "tova/basic/diagnostic_printer.hpp"
#include "tova/basic/errors.hpp"
#include "tova/driver/compiler.hpp"
#include "tova/project/project_config.hpp"
#include "tova/syntax/frontend.hpp"
#include "tova/syntax/lexer.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_compile_error = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Tova Compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [file|dir]         Build a file or the project found from dir\n"
            << "  check [file|dir]         Check syntax and semantics (no codegen)\n"
            << "  tokens <file>            Print the token stream\n"
            << "  ast <file>               Print the AST as JSON\n"
            << "  init [dir]               Write a starter tova.yaml\n\n"
            << "Options:\n"
            << "  -o, --output <dir>       Output directory\n"
            << "  --tolerant               Report analysis errors but still generate code\n"
            << "  --strict                 Treat operand type mismatches as errors\n"
            << "  --source-maps            Write source line mappings\n"
            << "  --no-color               Disable coloured diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input;
  std::string output_path;
  bool tolerant = false;
  bool strict = false;
  bool source_maps = false;
  bool verbose = false;
  bool no_color = false;
  bool show_help = false;
  std::string usage_error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 >= argc) {
        args.usage_error = arg + " requires a directory";
        return args;
      }
      args.output_path = argv[++i];
    } else if (arg == "--tolerant") {
      args.tolerant = true;
    } else if (arg == "--strict") {
      args.strict = true;
    } else if (arg == "--source-maps") {
      args.source_maps = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.usage_error = "unknown option '" + arg + "'";
      return args;
    } else if (args.input.empty()) {
      args.input = arg;
    } else {
      args.usage_error = "unexpected argument '" + arg + "'";
      return args;
    }
  }

  return args;
}

bool use_color(const CommandArgs & args) { return !args.no_color && isatty(fileno(stderr)) != 0; }

void print_error(const CommandArgs & args, const std::string & message)
{
  if (use_color(args)) {
    std::cerr << rang::style::bold << rang::fg::red << "error" << rang::fg::reset << ": "
              << message << rang::style::reset << "\n";
  } else {
    std::cerr << fmt::format("error: {}\n", message);
  }
}

void print_result(const CommandArgs & args, const tova::CompileResult & result)
{
  tova::DiagnosticPrinter printer(std::cerr, use_color(args));
  for (const auto & unit : result.units) {
    printer.print_all(unit.diagnostics, unit.source);
  }
  const tova::SourceManager no_source;
  for (const auto & diag : result.diagnostics) {
    printer.print(diag, no_source);
  }
  printer.print_summary(result.error_count(), result.warning_count());
}

bool read_file(const fs::path & path, std::string & out)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  out = buffer.str();
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int run_compile(const CommandArgs & args, tova::CompileMode mode)
{
  tova::CompileOptions options;
  options.mode = mode;
  options.verbose = args.verbose;
  options.analyzer.tolerant = args.tolerant;
  options.analyzer.strict = args.strict;
  options.codegen.sourceMaps = args.source_maps;
  if (!args.output_path.empty()) {
    options.output_dir = fs::absolute(args.output_path);
  }

  tova::CompileResult result;
  const fs::path input = args.input.empty() ? fs::current_path() : fs::absolute(args.input);

  if (fs::is_regular_file(input)) {
    if (args.verbose) {
      const char * verb = mode == tova::CompileMode::Build ? "Building" : "Checking";
      std::cerr << fmt::format("{}: {}\n", verb, input.string());
    }
    result = tova::Compiler::compile_file(input, options);
  } else {
    if (!fs::exists(input)) {
      print_error(args, "file not found: " + input.string());
      return k_exit_usage;
    }
    // Project mode: find tova.yaml
    const auto config_path = tova::find_project_config(input);
    if (!config_path) {
      print_error(args, "no tova.yaml found in " + input.string() + " or its parents");
      return k_exit_usage;
    }

    const auto config_result = tova::load_project_config(*config_path);
    if (!config_result.success) {
      print_error(args, config_path->string() + ": " + config_result.error);
      return k_exit_compile_error;
    }

    if (args.verbose) {
      std::cerr << fmt::format(
        "Project: {} ({})\n", config_result.config.project.name, config_path->string());
    }
    result = tova::Compiler::compile_project(config_result.config, options);
  }

  print_result(args, result);

  if (!result.success) {
    return k_exit_compile_error;
  }

  for (const auto & unit : result.units) {
    for (const auto & file : unit.generated_files) {
      std::cerr << fmt::format("Generated: {}\n", file.string());
    }
    if (mode == tova::CompileMode::Check) {
      std::cout << fmt::format("{}: OK\n", unit.source.get_file_label());
    }
  }
  return k_exit_ok;
}

int cmd_tokens(const CommandArgs & args)
{
  if (args.input.empty()) {
    print_error(args, "usage: tovac tokens <file>");
    return k_exit_usage;
  }

  std::string text;
  if (!read_file(args.input, text)) {
    print_error(args, "cannot read file: " + args.input);
    return k_exit_usage;
  }

  const tova::SourceManager sources(fs::path(args.input), std::move(text));
  try {
    tova::syntax::Lexer lexer(sources);
    for (const auto & tok : lexer.lex_all()) {
      std::cout << fmt::format(
        "{}:{}\t{}\t{}\n", tok.line, tok.column, tova::syntax::to_string(tok.kind), tok.text);
    }
  } catch (const tova::LexError & e) {
    tova::DiagnosticPrinter printer(std::cerr, use_color(args));
    printer.print(e.diagnostic(), sources);
    return k_exit_compile_error;
  }
  return k_exit_ok;
}

int cmd_ast(const CommandArgs & args)
{
  if (args.input.empty()) {
    print_error(args, "usage: tovac ast <file>");
    return k_exit_usage;
  }

  std::string text;
  if (!read_file(args.input, text)) {
    print_error(args, "cannot read file: " + args.input);
    return k_exit_usage;
  }

  try {
    const auto unit = tova::parse_source(text, fs::path(args.input));
    std::cout << tova::to_json(unit->program).dump(2) << "\n";
  } catch (const tova::CompileError & e) {
    const tova::SourceManager sources(fs::path(args.input), std::move(text));
    tova::DiagnosticPrinter printer(std::cerr, use_color(args));
    printer.print(e.diagnostic(), sources);
    return k_exit_compile_error;
  }
  return k_exit_ok;
}

int cmd_init(const CommandArgs & args)
{
  const fs::path project_dir = args.input.empty() ? fs::current_path() : fs::absolute(args.input);
  const fs::path config_path = project_dir / tova::k_project_config_file_name;

  if (fs::exists(config_path)) {
    print_error(args, "already initialized: " + config_path.string());
    return k_exit_usage;
  }

  std::error_code ec;
  fs::create_directories(project_dir / "src", ec);
  if (ec) {
    print_error(args, "cannot create " + (project_dir / "src").string() + ": " + ec.message());
    return k_exit_compile_error;
  }

  std::ofstream config(config_path);
  config << tova::default_project_config(project_dir.filename().string());
  if (!config) {
    print_error(args, "failed to write " + config_path.string());
    return k_exit_compile_error;
  }

  const fs::path main_path = project_dir / "src" / "main.tova";
  if (!fs::exists(main_path)) {
    std::ofstream main(main_path);
    main << "fn main() {\n"
         << "  print(\"Hello from Tova\")\n"
         << "}\n\n"
         << "main()\n";
  }

  std::cout << "Initialized new Tova project in " << project_dir.string() << "\n";
  std::cout << "\nNext steps:\n"
            << "  tovac build " << project_dir.string() << "\n";
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.usage_error.empty()) {
    print_error(args, args.usage_error);
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.command == "build") {
    return run_compile(args, tova::CompileMode::Build);
  }

  if (args.command == "check") {
    return run_compile(args, tova::CompileMode::Check);
  }

  if (args.command == "tokens") {
    return cmd_tokens(args);
  }

  if (args.command == "ast") {
    return cmd_ast(args);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  print_error(args, "unknown command '" + args.command + "'");
  print_usage(argv[0]);
  return k_exit_usage;
}
