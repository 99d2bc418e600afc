// tova/project/project_config.hpp - Project configuration (tova.yaml)
//
// Parses and validates tova.yaml project files. Used by the tovac driver
// and by anything else that needs a project's entry points and options.
//
#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tova
{

// ============================================================================
// Configuration Structures
// ============================================================================

/// Output targets a build can produce, in emission order.
inline constexpr std::array<std::string_view, 6> k_known_targets = {
  "shared", "client", "server", "edge", "deploy", "cli"};

[[nodiscard]] bool is_known_target(std::string_view name) noexcept;

/**
 * Project metadata section.
 */
struct ProjectInfo
{
  std::string name;
  std::string version;
};

/**
 * Build section.
 */
struct BuildConfig
{
  /// Source files to compile, relative to the project root
  std::vector<std::filesystem::path> entry_points;

  /// Output directory for generated files, relative to the project root
  std::filesystem::path output_dir = "build/tova";

  /// Targets to write; every known target by default
  std::vector<std::string> targets{k_known_targets.begin(), k_known_targets.end()};

  bool source_maps = false;
};

/**
 * Analyzer section.
 */
struct AnalyzerConfig
{
  bool tolerant = false;
  bool strict = false;
  bool warnings_as_errors = false;
};

/**
 * Complete project configuration (tova.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;
  BuildConfig build;
  AnalyzerConfig analyzer;

  /// Directory containing tova.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a tova.yaml file.
 *
 * Unknown keys are ignored. A value of the wrong shape (a scalar where a
 * list is expected, a non-boolean flag, an unknown target) fails the load.
 *
 * @param config_path Path to tova.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config, from YAML text already in memory.
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to tova.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Starter tova.yaml written by `tovac init`.
[[nodiscard]] std::string default_project_config(std::string_view project_name);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "tova.yaml";

}  // namespace tova
