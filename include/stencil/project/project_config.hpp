// stencil/project/project_config.hpp - Project configuration (stencil.yaml)
//
// Parses and validates stencil.yaml files.
// Used by the CLI; hosts embedding the engine may use it as well.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "stencil/runtime/renderer.hpp"
#include "stencil/runtime/value.hpp"

namespace stencil
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Engine configuration section.
 */
struct EngineConfig
{
  /// Root directory of component files (relative to stencil.yaml)
  std::filesystem::path views_dir = "views";

  /// Component file extension, including the leading dot
  std::string extension = ".stn";

  /// Keep parsed components in memory
  bool cache = true;

  /// Maximum `$render` nesting depth
  size_t max_render_depth = k_default_max_render_depth;
};

/**
 * Complete project configuration (stencil.yaml).
 */
struct ProjectConfig
{
  EngineConfig engine;

  /// Global table as a JSON object
  Value globals = Value::object();

  /// Directory containing stencil.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// views_dir resolved against project_root
  [[nodiscard]] std::filesystem::path resolved_views_dir() const
  {
    return engine.views_dir.is_absolute() ? engine.views_dir : project_root / engine.views_dir;
  }
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
 * Load a project configuration from a stencil.yaml file.
 *
 * @param config_path Path to stencil.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse stencil.yaml content that is already in memory.
 *
 * @param yaml_text    File content
 * @param project_root Directory used to resolve relative paths
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find stencil.yaml by searching upward from a directory, up to the
 * filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "stencil.yaml";

}  // namespace stencil
