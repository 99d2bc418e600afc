// tova/codegen/cli_emitter.hpp - `cli` blocks to a standalone argv dispatcher
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "tova/codegen/base_emitter.hpp"

namespace tova::codegen
{

/**
 * CLI output: the command functions as declared, generated help text,
 * and a dispatcher per command that parses argv into positionals and
 * flags before calling it.
 *
 * A parameter becomes a `--flag` when it is typed `Bool` or has a default
 * value; every other parameter is a required positional. Int, Float and
 * Bool parameters are coerced from their argv strings.
 */
class CliEmitter : public BaseEmitter
{
public:
  explicit CliEmitter(EmitContext & ctx) : BaseEmitter(ctx) {}

  std::string generate(const std::vector<const NamedBlock *> & blocks, const std::string & shared);

private:
  struct Config
  {
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> description;
    std::vector<const FunctionDecl *> commands;
    std::vector<const Stmt *> other;
  };

  static Config merge(const std::vector<const NamedBlock *> & blocks);

  std::string emit_command(const FunctionDecl * cmd);
  std::string emit_main_help(const Config & config);
  std::string emit_command_help(const FunctionDecl * cmd, const Config & config);
  std::string emit_dispatcher(const FunctionDecl * cmd);
  std::string emit_main(const Config & config);
};

}  // namespace tova::codegen
