// tests/unit/project/test_project_config.cpp - Unit tests for tova.yaml loading
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "tova/project/project_config.hpp"

using namespace tova;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / ("tova_project_" + name))
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

}  // namespace

TEST(ProjectConfig, ParsesAllSections)
{
  const auto r = parse_project_config(
    "project:\n"
    "  name: shop\n"
    "  version: 1.2.0\n"
    "build:\n"
    "  entry_points: [src/app.tova, src/admin.tova]\n"
    "  output_dir: dist\n"
    "  targets: [client, server]\n"
    "  source_maps: true\n"
    "analyzer:\n"
    "  strict: true\n",
    "/work/shop");
  ASSERT_TRUE(r.success) << r.error;

  const ProjectConfig & c = r.config;
  EXPECT_EQ(c.project.name, "shop");
  EXPECT_EQ(c.project.version, "1.2.0");
  ASSERT_EQ(c.build.entry_points.size(), 2U);
  EXPECT_EQ(c.build.entry_points[1], std::filesystem::path("src/admin.tova"));
  EXPECT_EQ(c.build.output_dir, std::filesystem::path("dist"));
  EXPECT_EQ(c.build.targets, (std::vector<std::string>{"client", "server"}));
  EXPECT_TRUE(c.build.source_maps);
  EXPECT_TRUE(c.analyzer.strict);
  EXPECT_FALSE(c.analyzer.tolerant);
  EXPECT_EQ(c.project_root, std::filesystem::path("/work/shop"));
}

TEST(ProjectConfig, MissingSectionsKeepDefaults)
{
  const auto r = parse_project_config("project:\n  name: tiny\n", "/tmp");
  ASSERT_TRUE(r.success);
  EXPECT_TRUE(r.config.build.entry_points.empty());
  EXPECT_EQ(r.config.build.output_dir, std::filesystem::path("build/tova"));
  EXPECT_EQ(r.config.build.targets.size(), k_known_targets.size());
  EXPECT_FALSE(r.config.build.source_maps);
}

TEST(ProjectConfig, EmptyDocumentIsValid)
{
  const auto r = parse_project_config("", "/tmp");
  EXPECT_TRUE(r.success);
}

TEST(ProjectConfig, RejectsUnknownTarget)
{
  const auto r = parse_project_config("build:\n  targets: [client, mobile]\n", "/tmp");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(
    r.error,
    "invalid build.targets entry: 'mobile' (expected one of: shared, client, server, edge, "
    "deploy, cli)");
}

TEST(ProjectConfig, RejectsScalarTargets)
{
  const auto r = parse_project_config("build:\n  targets: client\n", "/tmp");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "build.'targets' must be a list");
}

TEST(ProjectConfig, RejectsNonBooleanFlag)
{
  const auto r = parse_project_config("analyzer:\n  strict: maybe\n", "/tmp");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "analyzer.'strict' must be true or false, got 'maybe'");
}

TEST(ProjectConfig, RejectsNonMapRoot)
{
  const auto r = parse_project_config("- a\n- b\n", "/tmp");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error, "top level of tova.yaml must be a map");
}

TEST(ProjectConfig, ReportsYamlSyntaxErrors)
{
  const auto r = parse_project_config("project: [unclosed\n", "/tmp");
  ASSERT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML: ", 0), 0U);
}

TEST(ProjectConfig, DefaultConfigRoundTrips)
{
  const auto r = parse_project_config(default_project_config("demo"), "/tmp/demo");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.project.name, "demo");
  ASSERT_EQ(r.config.build.entry_points.size(), 1U);
  EXPECT_EQ(r.config.build.entry_points[0], std::filesystem::path("src/main.tova"));
  EXPECT_EQ(r.config.build.targets.size(), k_known_targets.size());
}

TEST(ProjectConfig, FindSearchesUpward)
{
  TempDir dir("find");
  const auto nested = dir.path / "src" / "pages";
  std::filesystem::create_directories(nested);
  {
    std::ofstream out(dir.path / k_project_config_file_name);
    out << default_project_config("found");
  }

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(
    std::filesystem::canonical(*found),
    std::filesystem::canonical(dir.path / k_project_config_file_name));

  const auto loaded = load_project_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.project.name, "found");
  EXPECT_EQ(
    std::filesystem::canonical(loaded.config.project_root), std::filesystem::canonical(dir.path));
}

TEST(ProjectConfig, LoadMissingFileFails)
{
  const auto r = load_project_config("/nonexistent/tova.yaml");
  ASSERT_FALSE(r.success);
  EXPECT_NE(r.error.find("configuration file not found"), std::string::npos);
}

TEST(ProjectConfig, KnownTargets)
{
  EXPECT_TRUE(is_known_target("edge"));
  EXPECT_TRUE(is_known_target("deploy"));
  EXPECT_FALSE(is_known_target("mobile"));
}
