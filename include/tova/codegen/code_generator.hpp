// tova/codegen/code_generator.hpp - Program to per-target JavaScript outputs
//
// CodeGenerator groups the top-level statements of an analyzed program by
// region and runs the emitter for each target. A program with no region
// blocks is a plain module: everything lands in the shared output.
//
#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "tova/ast/ast.hpp"
#include "tova/basic/source_manager.hpp"

namespace tova::codegen
{

struct CodegenOptions
{
  /// Record source line -> output line mappings for the shared output.
  bool sourceMaps = false;
};

/// One top-level statement of the shared output (all 1-indexed).
struct SourceMapping
{
  uint32_t sourceLine = 0;
  uint32_t sourceColumn = 0;
  uint32_t outputLine = 0;
};

struct GenerateResult
{
  std::string shared;
  std::string client;
  std::string server;
  std::string edge;                          ///< unnamed edge blocks
  std::string cli;
  std::map<std::string, std::string> edges;  ///< named edge blocks
  nlohmann::json deploy = nlohmann::json::object();
  std::optional<std::vector<SourceMapping>> sourceMappings;
  bool isModule = false;

  /// `[{"source_line", "source_column", "output_line"}, ...]`; null when
  /// source maps were off.
  [[nodiscard]] nlohmann::json mappings_json() const;
};

class CodeGenerator
{
public:
  explicit CodeGenerator(const SourceManager & sources, CodegenOptions options = {})
  : sources_(sources), options_(options)
  {
  }

  /**
   * Emit every target for `program`. The program must have passed
   * analysis; CodegenError signals a node kind no emitter handles.
   */
  GenerateResult generate(const Program & program);

private:
  const SourceManager & sources_;
  CodegenOptions options_;
};

}  // namespace tova::codegen
