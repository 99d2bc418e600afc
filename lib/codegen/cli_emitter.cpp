// tova/codegen/cli_emitter.cpp - `cli` blocks to a standalone argv dispatcher
#include "tova/codegen/cli_emitter.hpp"

#include <fmt/format.h>

namespace tova::codegen
{

namespace
{

std::string_view type_name(const Param * p)
{
  if (const auto * named = dyn_cast<NamedType>(p->type)) return named->name;
  return {};
}

bool is_flag(const Param * p) { return type_name(p) == "Bool" || p->defaultValue != nullptr; }

bool is_async_command(const FunctionDecl * cmd) { return cmd->isAsync || needs_async(cmd->body); }

/// `lines.push("...");` for one help line.
std::string help_line(std::string_view text)
{
  return "  lines.push(" + quote_js(text) + ");";
}

std::string pad(std::string_view s, size_t width)
{
  std::string out(s);
  if (out.size() < width) out.append(width - out.size(), ' ');
  return out;
}

/// Convert one argv string expression to the parameter's declared type.
std::string coerce(const std::string & expr, std::string_view type, std::string_view name)
{
  if (type == "Int") {
    return fmt::format(
      "(function(v) {{ const n = parseInt(v, 10); if (isNaN(n)) {{ console.error(\"Error: {} "
      "must be an integer, got \\\"\" + v + \"\\\"\"); process.exit(1); }} return n; }})({})",
      name, expr);
  }
  if (type == "Float") {
    return fmt::format(
      "(function(v) {{ const n = parseFloat(v); if (isNaN(n)) {{ console.error(\"Error: {} "
      "must be a number, got \\\"\" + v + \"\\\"\"); process.exit(1); }} return n; }})({})",
      name, expr);
  }
  if (type == "Bool") {
    return fmt::format("({0} === \"true\" || {0} === \"1\" || {0} === \"yes\")", expr);
  }
  return expr;
}

std::string default_text(const Param * p)
{
  switch (p->defaultValue->get_kind()) {
    case NodeKind::StringLiteral:
      return "\"" + std::string(cast<StringLiteral>(p->defaultValue)->value) + "\"";
    case NodeKind::NumberLiteral:
      return std::string(cast<NumberLiteral>(p->defaultValue)->text);
    case NodeKind::BoolLiteral:
      return cast<BoolLiteral>(p->defaultValue)->value ? "true" : "false";
    default:
      return "...";
  }
}

std::string usage_line(const FunctionDecl * cmd, const std::string & program)
{
  std::vector<std::string> parts{program, std::string(cmd->name)};
  for (const auto * p : cmd->params) {
    const std::string_view type = type_name(p);
    if (type == "Bool") {
      parts.push_back(fmt::format("[--{}]", p->name));
    } else if (p->defaultValue) {
      parts.push_back(fmt::format("[--{} <{}>]", p->name, type.empty() ? "value" : type));
    } else {
      parts.push_back(fmt::format("<{}>", p->name));
    }
  }
  return join(parts, " ");
}

std::string description_of(const FunctionDecl * cmd)
{
  return cmd->docs.empty() ? std::string() : std::string(cmd->docs[0]);
}

}  // namespace

CliEmitter::Config CliEmitter::merge(const std::vector<const NamedBlock *> & blocks)
{
  Config config;
  for (const auto * block : blocks) {
    for (const Stmt * s : block->body) {
      if (const auto * field = dyn_cast<ConfigField>(s)) {
        const auto * str = dyn_cast<StringLiteral>(field->value);
        if (!str) continue;
        if (field->key == "name") {
          config.name = std::string(str->value);
        } else if (field->key == "version") {
          config.version = std::string(str->value);
        } else if (field->key == "description") {
          config.description = std::string(str->value);
        }
      } else if (const auto * fn = dyn_cast<FunctionDecl>(s)) {
        config.commands.push_back(fn);
      } else {
        config.other.push_back(s);
      }
    }
  }
  return config;
}

std::string CliEmitter::emit_command(const FunctionDecl * cmd) { return emit_function(cmd); }

std::string CliEmitter::emit_main_help(const Config & config)
{
  const std::string program = config.name.value_or("cli");

  std::vector<std::string> lines{"function __cli_help() {", "  const lines = [];"};
  if (config.name) {
    lines.push_back(help_line(
      config.description ? *config.name + " - " + *config.description : *config.name));
  }
  if (config.version) lines.push_back(help_line("Version: " + *config.version));
  lines.push_back(help_line(""));
  lines.push_back(help_line("USAGE:"));

  if (config.commands.size() == 1) {
    lines.push_back(help_line("  " + usage_line(config.commands.front(), program)));
  } else {
    lines.push_back(help_line("  " + program + " <command> [options]"));
    lines.push_back(help_line(""));
    lines.push_back(help_line("COMMANDS:"));
    for (const auto * cmd : config.commands) {
      lines.push_back(help_line("  " + pad(cmd->name, 16) + description_of(cmd)));
    }
  }

  lines.push_back(help_line(""));
  lines.push_back(help_line("OPTIONS:"));
  lines.push_back(help_line("  --help, -h     Show help"));
  if (config.version) lines.push_back(help_line("  --version, -v  Show version"));
  lines.emplace_back("  console.log(lines.join(\"\\n\"));");
  lines.emplace_back("}");
  return join(lines, "\n");
}

std::string CliEmitter::emit_command_help(const FunctionDecl * cmd, const Config & config)
{
  std::vector<std::string> lines{
    fmt::format("function __cli_command_help_{}() {{", cmd->name), "  const lines = [];"};
  lines.push_back(help_line("USAGE:"));
  lines.push_back(help_line("  " + usage_line(cmd, config.name.value_or("cli"))));

  std::vector<const Param *> positionals;
  std::vector<const Param *> flags;
  for (const auto * p : cmd->params) (is_flag(p) ? flags : positionals).push_back(p);

  if (!positionals.empty()) {
    lines.push_back(help_line(""));
    lines.push_back(help_line("ARGUMENTS:"));
    for (const auto * p : positionals) {
      const std::string_view type = type_name(p);
      lines.push_back(
        help_line("  " + pad(p->name, 16) + (type.empty() ? "" : "<" + std::string(type) + ">")));
    }
  }

  lines.push_back(help_line(""));
  lines.push_back(help_line("OPTIONS:"));
  for (const auto * f : flags) {
    const std::string_view type = type_name(f);
    std::string detail;
    if (type != "Bool" && !type.empty()) detail = "<" + std::string(type) + ">";
    if (f->defaultValue) {
      detail += (detail.empty() ? "" : " ") + ("(default: " + default_text(f) + ")");
    }
    lines.push_back(help_line("  --" + pad(f->name, 14) + detail));
  }
  lines.push_back(help_line("  --help, -h      Show help"));
  lines.emplace_back("  console.log(lines.join(\"\\n\"));");
  lines.emplace_back("}");
  return join(lines, "\n");
}

std::string CliEmitter::emit_dispatcher(const FunctionDecl * cmd)
{
  const bool is_async = is_async_command(cmd);

  std::vector<const Param *> positionals;
  std::vector<const Param *> flags;
  for (const auto * p : cmd->params) (is_flag(p) ? flags : positionals).push_back(p);

  std::vector<std::string> lines;
  lines.push_back(fmt::format(
    "{}function __cli_dispatch_{}(argv) {{", is_async ? "async " : "", cmd->name));

  for (const auto * f : flags) {
    const std::string init = type_name(f) == "Bool" && !f->defaultValue
                               ? std::string("false")
                               : emit_expr(f->defaultValue);
    lines.push_back(fmt::format("  let __flag_{} = {};", f->name, init));
  }
  lines.emplace_back("  const __positionals = [];");
  lines.emplace_back("  for (let __i = 0; __i < argv.length; __i++) {");
  lines.emplace_back("    const __arg = argv[__i];");
  lines.push_back(fmt::format(
    "    if (__arg === \"--help\" || __arg === \"-h\") {{ __cli_command_help_{}(); return; }}",
    cmd->name));

  for (const auto * f : flags) {
    const std::string_view type = type_name(f);
    if (type == "Bool") {
      lines.push_back(fmt::format(
        "    if (__arg === \"--{0}\") {{ __flag_{0} = true; continue; }}", f->name));
      lines.push_back(fmt::format(
        "    if (__arg === \"--no-{0}\") {{ __flag_{0} = false; continue; }}", f->name));
      continue;
    }
    lines.push_back(fmt::format("    if (__arg === \"--{}\") {{", f->name));
    lines.push_back(fmt::format(
      "      if (__i + 1 >= argv.length) {{ console.error(\"Error: --{} requires a value\"); "
      "process.exit(1); }}",
      f->name));
    const std::string option = "--" + std::string(f->name);
    lines.push_back(
      fmt::format("      __flag_{} = {};", f->name, coerce("argv[++__i]", type, option)));
    lines.emplace_back("      continue;");
    lines.emplace_back("    }");
    lines.push_back(fmt::format("    if (__arg.startsWith(\"--{}=\")) {{", f->name));
    lines.push_back(fmt::format(
      "      __flag_{} = {};", f->name,
      coerce(fmt::format("__arg.slice({})", f->name.size() + 3), type, option)));
    lines.emplace_back("      continue;");
    lines.emplace_back("    }");
  }

  lines.emplace_back(
    "    if (__arg.startsWith(\"--\")) { console.error(\"Error: Unknown flag \" + __arg); "
    "process.exit(1); }");
  lines.emplace_back("    __positionals.push(__arg);");
  lines.emplace_back("  }");

  for (size_t i = 0; i < positionals.size(); ++i) {
    lines.push_back(fmt::format("  if (__positionals.length <= {}) {{", i));
    lines.push_back(fmt::format(
      "    console.error(\"Error: Missing required argument <{}>\");", positionals[i]->name));
    lines.push_back(fmt::format("    __cli_command_help_{}();", cmd->name));
    lines.emplace_back("    process.exit(1);");
    lines.emplace_back("  }");
  }

  std::vector<std::string> args;
  size_t next_positional = 0;
  for (const auto * p : cmd->params) {
    if (is_flag(p)) {
      args.push_back("__flag_" + std::string(p->name));
    } else {
      args.push_back(
        coerce(fmt::format("__positionals[{}]", next_positional++), type_name(p), p->name));
    }
  }
  lines.push_back(
    fmt::format("  {}{}({});", is_async ? "await " : "", cmd->name, join(args, ", ")));
  lines.emplace_back("}");
  return join(lines, "\n");
}

std::string CliEmitter::emit_main(const Config & config)
{
  std::vector<std::string> lines{"async function __cli_main(argv) {"};

  if (config.commands.size() == 1) {
    lines.emplace_back(
      "  if (argv.includes(\"--help\") || argv.includes(\"-h\")) { __cli_help(); return; }");
    if (config.version) {
      lines.push_back(fmt::format(
        "  if (argv.includes(\"--version\") || argv.includes(\"-v\")) {{ console.log({}); return; }}",
        quote_js(*config.version)));
    }
    lines.push_back(fmt::format("  await __cli_dispatch_{}(argv);", config.commands.front()->name));
  } else {
    lines.emplace_back(
      "  if (argv.length === 0 || argv[0] === \"--help\" || argv[0] === \"-h\") { __cli_help(); "
      "return; }");
    if (config.version) {
      lines.push_back(fmt::format(
        "  if (argv[0] === \"--version\" || argv[0] === \"-v\") {{ console.log({}); return; }}",
        quote_js(*config.version)));
    }
    lines.emplace_back("  const __subcmd = argv[0];");
    lines.emplace_back("  const __subargv = argv.slice(1);");
    lines.emplace_back("  switch (__subcmd) {");
    for (const auto * cmd : config.commands) {
      lines.push_back(fmt::format(
        "    case {}: await __cli_dispatch_{}(__subargv); break;", quote_js(cmd->name), cmd->name));
    }
    lines.emplace_back("    default:");
    lines.emplace_back("      console.error(\"Error: Unknown command \\\"\" + __subcmd + \"\\\"\");");
    lines.emplace_back("      __cli_help();");
    lines.emplace_back("      process.exit(1);");
    lines.emplace_back("  }");
  }
  lines.emplace_back("}");
  return join(lines, "\n");
}

std::string CliEmitter::generate(
  const std::vector<const NamedBlock *> & blocks, const std::string & shared)
{
  const Config config = merge(blocks);
  for (const auto * cmd : config.commands) declare(cmd->name);

  std::vector<std::string> sections;
  if (!shared.empty()) sections.push_back(shared);
  for (const Stmt * s : config.other) {
    std::string code = emit_stmt(s);
    if (!code.empty()) sections.push_back(std::move(code));
  }
  for (const auto * cmd : config.commands) sections.push_back(emit_command(cmd));
  sections.push_back(emit_main_help(config));
  for (const auto * cmd : config.commands) sections.push_back(emit_command_help(cmd, config));
  for (const auto * cmd : config.commands) sections.push_back(emit_dispatcher(cmd));
  sections.push_back(emit_main(config));
  sections.emplace_back("__cli_main(process.argv.slice(2));");
  return join(sections, "\n\n") + "\n";
}

}  // namespace tova::codegen
