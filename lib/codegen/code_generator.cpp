// tova/codegen/code_generator.cpp - Program to per-target JavaScript outputs
#include "tova/codegen/code_generator.hpp"

#include <algorithm>

#include "tova/codegen/base_emitter.hpp"
#include "tova/codegen/cli_emitter.hpp"
#include "tova/codegen/client_emitter.hpp"
#include "tova/codegen/deploy_emitter.hpp"
#include "tova/codegen/edge_emitter.hpp"
#include "tova/codegen/emit_context.hpp"
#include "tova/codegen/server_emitter.hpp"
#include "tova/codegen/stdlib.hpp"

namespace tova::codegen
{

namespace
{

using BlockList = std::vector<const NamedBlock *>;

struct Regions
{
  BlockList shared;
  BlockList client;
  BlockList server;
  BlockList edge;   // unnamed
  std::map<std::string, BlockList> namedEdges;
  BlockList deploy;
  BlockList cli;
  BlockList security;
  std::vector<const Stmt *> topLevel;
  bool any = false;
};

Regions group(const Program & program)
{
  Regions r;
  for (const Stmt * s : program.body) {
    const auto * block = dyn_cast<NamedBlock>(s);
    if (block == nullptr) {
      r.topLevel.push_back(s);
      continue;
    }
    r.any = true;
    switch (block->blockKind) {
      case BlockKind::Shared:
        r.shared.push_back(block);
        break;
      case BlockKind::Client:
        r.client.push_back(block);
        break;
      case BlockKind::Server:
        r.server.push_back(block);
        break;
      case BlockKind::Edge:
        if (block->name.empty()) {
          r.edge.push_back(block);
        } else {
          r.namedEdges[std::string(block->name)].push_back(block);
        }
        break;
      case BlockKind::Deploy:
        r.deploy.push_back(block);
        break;
      case BlockKind::Cli:
        r.cli.push_back(block);
        break;
      case BlockKind::Security:
        r.security.push_back(block);
        break;
    }
  }
  return r;
}

uint32_t count_lines(const std::string & text)
{
  if (text.empty()) return 0;
  return static_cast<uint32_t>(std::count(text.begin(), text.end(), '\n')) + 1;
}

}  // namespace

nlohmann::json GenerateResult::mappings_json() const
{
  if (!sourceMappings) return nullptr;
  nlohmann::json out = nlohmann::json::array();
  for (const auto & m : *sourceMappings) {
    out.push_back(
      {{"source_line", m.sourceLine},
       {"source_column", m.sourceColumn},
       {"output_line", m.outputLine}});
  }
  return out;
}

GenerateResult CodeGenerator::generate(const Program & program)
{
  EmitContext ctx;
  collect_usage(program, ctx);

  const Regions regions = group(program);
  GenerateResult result;
  result.isModule = !regions.any;

  // Shared output: stdlib, then shared blocks, then top-level code.
  BaseEmitter shared_emitter(ctx);
  std::vector<std::string> sections;
  std::string stdlib_code = stdlib::emit(ctx.usedBuiltins);
  if (!stdlib_code.empty()) sections.push_back(std::move(stdlib_code));
  for (const auto * block : regions.shared) {
    std::string code = shared_emitter.emit_statements(block->body);
    if (!code.empty()) sections.push_back(std::move(code));
  }

  std::string shared;
  for (const auto & s : sections) shared += (shared.empty() ? "" : "\n\n") + s;

  std::vector<SourceMapping> mappings;
  bool first_top_level = true;
  for (const Stmt * s : regions.topLevel) {
    std::string code = shared_emitter.emit_stmt(s);
    if (code.empty()) continue;
    if (!shared.empty()) shared += first_top_level ? "\n\n" : "\n";
    first_top_level = false;

    if (options_.sourceMaps) {
      const LineColumn lc = sources_.get_line_column(s->get_range().get_begin());
      const uint32_t output_line = shared.empty() ? 1 : count_lines(shared);
      mappings.push_back(SourceMapping{lc.line, lc.column, output_line});
    }
    shared += code;
  }
  if (options_.sourceMaps) result.sourceMappings = std::move(mappings);
  result.shared = shared.empty() ? shared : shared + "\n";

  if (result.isModule) return result;

  if (!regions.client.empty()) {
    ClientEmitter client(ctx);
    result.client = client.generate(regions.client, shared, server_functions(regions.server));
  }
  if (!regions.server.empty() || !regions.security.empty()) {
    ServerEmitter server(ctx);
    result.server = server.generate(regions.server, shared, regions.security);
  }
  if (!regions.edge.empty()) {
    EdgeEmitter edge(ctx);
    result.edge = edge.generate(regions.edge, shared);
  }
  for (const auto & [name, blocks] : regions.namedEdges) {
    EdgeEmitter edge(ctx);
    result.edges[name] = edge.generate(blocks, shared);
  }
  if (!regions.deploy.empty()) {
    DeployEmitter deploy(ctx);
    result.deploy = deploy.generate(regions.deploy);
  }
  if (!regions.cli.empty()) {
    CliEmitter cli(ctx);
    result.cli = cli.generate(regions.cli, shared);
  }
  return result;
}

}  // namespace tova::codegen
