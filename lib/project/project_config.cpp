// tova/project/project_config.cpp - Project configuration implementation
//
#include "tova/project/project_config.hpp"

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>

namespace tova
{

namespace
{

/// Read an optional boolean flag; false with `error` set on a bad value.
bool read_flag(const YAML::Node & section, const char * key, bool & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) return true;
  if (!node.IsScalar()) {
    error = fmt::format("'{}' must be true or false", key);
    return false;
  }
  try {
    out = node.as<bool>();
  } catch (const YAML::BadConversion &) {
    error = fmt::format("'{}' must be true or false, got '{}'", key, node.Scalar());
    return false;
  }
  return true;
}

bool read_string(
  const YAML::Node & section, const char * key, std::string & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) return true;
  if (!node.IsScalar()) {
    error = fmt::format("'{}' must be a string", key);
    return false;
  }
  out = node.Scalar();
  return true;
}

bool read_list(
  const YAML::Node & section, const char * key, std::vector<std::string> & out, std::string & error)
{
  const YAML::Node node = section[key];
  if (!node) return true;
  if (!node.IsSequence()) {
    error = fmt::format("'{}' must be a list", key);
    return false;
  }
  out.clear();
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = fmt::format("entries of '{}' must be strings", key);
      return false;
    }
    out.push_back(item.Scalar());
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;
  std::string error;

  if (root.IsNull()) return ConfigLoadResult::ok(std::move(config));
  if (!root.IsMap()) return ConfigLoadResult::fail("top level of tova.yaml must be a map");

  // Parse 'project' section
  if (const YAML::Node project = root["project"]) {
    if (!project.IsMap()) return ConfigLoadResult::fail("'project' must be a map");
    if (
      !read_string(project, "name", config.project.name, error) ||
      !read_string(project, "version", config.project.version, error)) {
      return ConfigLoadResult::fail("project." + error);
    }
  }

  // Parse 'build' section
  if (const YAML::Node build = root["build"]) {
    if (!build.IsMap()) return ConfigLoadResult::fail("'build' must be a map");

    std::vector<std::string> entries;
    if (!read_list(build, "entry_points", entries, error)) {
      return ConfigLoadResult::fail("build." + error);
    }
    for (auto & e : entries) config.build.entry_points.emplace_back(std::move(e));

    std::string output_dir;
    if (!read_string(build, "output_dir", output_dir, error)) {
      return ConfigLoadResult::fail("build." + error);
    }
    if (!output_dir.empty()) config.build.output_dir = output_dir;

    if (!read_list(build, "targets", config.build.targets, error)) {
      return ConfigLoadResult::fail("build." + error);
    }
    for (const auto & t : config.build.targets) {
      if (!is_known_target(t)) {
        return ConfigLoadResult::fail(fmt::format(
          "invalid build.targets entry: '{}' (expected one of: shared, client, server, edge, "
          "deploy, cli)",
          t));
      }
    }

    if (!read_flag(build, "source_maps", config.build.source_maps, error)) {
      return ConfigLoadResult::fail("build." + error);
    }
  }

  // Parse 'analyzer' section
  if (const YAML::Node analyzer = root["analyzer"]) {
    if (!analyzer.IsMap()) return ConfigLoadResult::fail("'analyzer' must be a map");
    if (
      !read_flag(analyzer, "tolerant", config.analyzer.tolerant, error) ||
      !read_flag(analyzer, "strict", config.analyzer.strict, error) ||
      !read_flag(analyzer, "warnings_as_errors", config.analyzer.warnings_as_errors, error)) {
      return ConfigLoadResult::fail("analyzer." + error);
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

bool is_known_target(std::string_view name) noexcept
{
  return std::find(k_known_targets.begin(), k_known_targets.end(), name) != k_known_targets.end();
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root, project_root);
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return parse_root(root, fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_project_config(std::string_view project_name)
{
  return fmt::format(
    "project:\n"
    "  name: {}\n"
    "  version: 0.1.0\n"
    "build:\n"
    "  entry_points: [src/main.tova]\n"
    "  output_dir: build/tova\n"
    "  targets: [shared, client, server, edge, deploy, cli]\n"
    "  source_maps: false\n"
    "analyzer:\n"
    "  tolerant: false\n"
    "  strict: false\n"
    "  warnings_as_errors: false\n",
    project_name);
}

}  // namespace tova
