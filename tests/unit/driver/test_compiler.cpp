// tests/unit/driver/test_compiler.cpp - Unit tests for the compiler driver
//
// Covers in-memory compilation, the Check/Build split, output naming and
// the files compile_file / compile_project write to disk.
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "tova/driver/compiler.hpp"
#include "tova/project/project_config.hpp"

using namespace tova;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / ("tova_driver_" + name))
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & path, const std::string & text)
{
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << text;
}

std::string read_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

const char * const k_full_stack =
  "shared {\n"
  "  fn clamp(x, lo, hi) { if x < lo { lo } else { x } }\n"
  "}\n"
  "server {\n"
  "  fn get_count() { 42 }\n"
  "}\n"
  "client {\n"
  "  state count = 0\n"
  "  component App {\n"
  "    <p>{count}</p>\n"
  "  }\n"
  "}\n";

}  // namespace

// ============================================================================
// compile_source
// ============================================================================

TEST(DriverCompiler, CompileSourceProducesOutput)
{
  const CompileResult result = Compiler::compile_source("x = 1\nprint(x)\n", "main.tova", {});
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.units.size(), 1U);
  const CompiledUnit & unit = result.units[0];
  ASSERT_TRUE(unit.output.has_value());
  EXPECT_TRUE(unit.output->isModule);
  EXPECT_NE(unit.output->shared.find("const x = 1;"), std::string::npos);
  EXPECT_TRUE(unit.generated_files.empty());
}

TEST(DriverCompiler, SyntaxErrorIsReportedOnTheUnit)
{
  const CompileResult result = Compiler::compile_source("x = (1 +\n", "broken.tova", {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.units.size(), 1U);
  EXPECT_TRUE(result.units[0].diagnostics.has_errors());
  EXPECT_FALSE(result.units[0].output.has_value());
  EXPECT_GE(result.error_count(), 1U);
}

TEST(DriverCompiler, AnalysisErrorStopsCodegen)
{
  const CompileResult result = Compiler::compile_source("x = 1\nx = 2\n", "main.tova", {});
  EXPECT_FALSE(result.success);
  ASSERT_EQ(result.units.size(), 1U);
  EXPECT_FALSE(result.units[0].output.has_value());
}

TEST(DriverCompiler, TolerantModeStillGenerates)
{
  CompileOptions options;
  options.analyzer.tolerant = true;
  const CompileResult result = Compiler::compile_source("x = 1\nx = 2\n", "main.tova", options);
  EXPECT_TRUE(result.success);
  ASSERT_EQ(result.units.size(), 1U);
  EXPECT_TRUE(result.units[0].diagnostics.has_errors());
  EXPECT_TRUE(result.units[0].output.has_value());
}

TEST(DriverCompiler, CheckModeSkipsCodegen)
{
  CompileOptions options;
  options.mode = CompileMode::Check;
  const CompileResult result = Compiler::compile_source("x = 1\n", "main.tova", options);
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.units[0].output.has_value());
}

TEST(DriverCompiler, WarningsAsErrors)
{
  const std::string src = "fn getUser() { nil }\n";

  const CompileResult lenient = Compiler::compile_source(src, "main.tova", {});
  EXPECT_TRUE(lenient.success);
  EXPECT_GE(lenient.warning_count(), 1U);

  CompileOptions options;
  options.warnings_as_errors = true;
  const CompileResult strict = Compiler::compile_source(src, "main.tova", options);
  EXPECT_FALSE(strict.success);
}

// ============================================================================
// Output naming
// ============================================================================

TEST(DriverCompiler, OutputFileNames)
{
  EXPECT_EQ(Compiler::output_file_name("app", "client", false), "app.client.js");
  EXPECT_EQ(Compiler::output_file_name("app", "shared", false), "app.shared.js");
  EXPECT_EQ(Compiler::output_file_name("app", "shared", true), "app.js");
  EXPECT_EQ(Compiler::output_file_name("app", "deploy", false), "app.deploy.json");
  EXPECT_EQ(Compiler::output_file_name("app", "edge.api", false), "app.edge.api.js");
}

// ============================================================================
// Writing files
// ============================================================================

TEST(DriverCompiler, CompileFileWritesOneFilePerTarget)
{
  TempDir dir("compile_file");
  const auto src = dir.path / "app.tova";
  write_file(src, k_full_stack);

  CompileOptions options;
  options.output_dir = dir.path / "out";
  const CompileResult result = Compiler::compile_file(src, options);
  ASSERT_TRUE(result.success);

  const auto out = dir.path / "out";
  EXPECT_TRUE(std::filesystem::exists(out / "app.shared.js"));
  EXPECT_TRUE(std::filesystem::exists(out / "app.client.js"));
  EXPECT_TRUE(std::filesystem::exists(out / "app.server.js"));
  EXPECT_FALSE(std::filesystem::exists(out / "app.edge.js"));
  EXPECT_FALSE(std::filesystem::exists(out / "app.deploy.json"));
  EXPECT_EQ(result.units[0].generated_files.size(), 3U);

  const std::string client = read_file(out / "app.client.js");
  EXPECT_NE(client.find("createSignal(0)"), std::string::npos);
  EXPECT_NE(client.find("get_count: (...args) => __rpc(\"get_count\", args),"), std::string::npos);
}

TEST(DriverCompiler, TargetFilterLimitsWrittenFiles)
{
  TempDir dir("targets");
  const auto src = dir.path / "app.tova";
  write_file(src, k_full_stack);

  CompileOptions options;
  options.output_dir = dir.path / "out";
  options.targets = {"server"};
  const CompileResult result = Compiler::compile_file(src, options);
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(std::filesystem::exists(dir.path / "out" / "app.server.js"));
  EXPECT_FALSE(std::filesystem::exists(dir.path / "out" / "app.client.js"));
}

TEST(DriverCompiler, ModuleAndSourceMapLandNextToSource)
{
  TempDir dir("module");
  const auto src = dir.path / "util.tova";
  write_file(src, "x = 1\ny = 2\n");

  CompileOptions options;
  options.codegen.sourceMaps = true;
  const CompileResult result = Compiler::compile_file(src, options);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(read_file(dir.path / "util.js"), "const x = 1;\nconst y = 2;\n");
  const std::string map = read_file(dir.path / "util.sourcemap.json");
  EXPECT_NE(map.find("\"output_line\": 2"), std::string::npos);
}

TEST(DriverCompiler, DeployConfigIsWrittenAsJson)
{
  TempDir dir("deploy");
  const auto src = dir.path / "app.tova";
  write_file(src, "deploy \"prod\" {\n  server: \"root@example.com\"\n}\n");

  CompileOptions options;
  options.output_dir = dir.path;
  const CompileResult result = Compiler::compile_file(src, options);
  ASSERT_TRUE(result.success);
  const std::string json = read_file(dir.path / "app.deploy.json");
  EXPECT_NE(json.find("\"server\": \"root@example.com\""), std::string::npos);
  EXPECT_NE(json.find("\"memory\": \"512mb\""), std::string::npos);
}

TEST(DriverCompiler, MissingFileFails)
{
  const CompileResult result =
    Compiler::compile_file("/nonexistent/dir/missing.tova", CompileOptions{});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.units.empty());
  ASSERT_EQ(result.diagnostics.errors().size(), 1U);
  EXPECT_NE(result.diagnostics.errors()[0].message.find("file not found"), std::string::npos);
}

// ============================================================================
// compile_project
// ============================================================================

TEST(DriverCompiler, CompileProjectUsesConfiguredOutputDir)
{
  TempDir dir("project");
  write_file(dir.path / "src" / "main.tova", "print(\"hi\")\n");

  ProjectConfig config;
  config.project.name = "demo";
  config.project_root = dir.path;
  config.build.entry_points = {"src/main.tova"};
  config.build.output_dir = "dist";

  const CompileResult result = Compiler::compile_project(config, CompileOptions{});
  ASSERT_TRUE(result.success);
  EXPECT_TRUE(std::filesystem::exists(dir.path / "dist" / "main.js"));
}

TEST(DriverCompiler, CompileProjectReportsMissingEntryPoint)
{
  TempDir dir("project_missing");
  ProjectConfig config;
  config.project_root = dir.path;
  config.build.entry_points = {"src/absent.tova"};

  const CompileResult result = Compiler::compile_project(config, CompileOptions{});
  EXPECT_FALSE(result.success);
  ASSERT_FALSE(result.diagnostics.errors().empty());
  EXPECT_NE(
    result.diagnostics.errors()[0].message.find("entry point not found"), std::string::npos);
}

TEST(DriverCompiler, CompileProjectWithoutEntryPointsFails)
{
  const CompileResult result = Compiler::compile_project(ProjectConfig{}, CompileOptions{});
  EXPECT_FALSE(result.success);
}
