// nstg/project/project_config.hpp - Project configuration (nstg.yaml)
//
// Parses and validates nstg.yaml analysis settings.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "nstg/driver/analyzer.hpp"
#include "nstg/generation/test_generator.hpp"

namespace nstg
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Output section: where test cases go and in which order.
 */
struct OutputConfig
{
  /// Output file for generated test cases (relative to nstg.yaml); stdout when unset
  std::optional<std::filesystem::path> path;

  TestOrdering ordering = TestOrdering::Priority;
};

/**
 * Complete project configuration (nstg.yaml).
 *
 * ```yaml
 * project:
 *   name: my-lib
 * analysis:
 *   max_negative_space_regions: 1000
 *   max_boundary_tests: 100
 *   timeout_ms: 30000
 *   include_edge_cases: true
 *   smt_solver_enabled: true
 *   strategy: balanced
 * output:
 *   path: tests.json
 *   ordering: error-first
 * ```
 */
struct ProjectConfig
{
  std::string name;
  AnalysisConfig analysis;
  OutputConfig output;

  /// Directory containing nstg.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

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
 * Load a project configuration from an nstg.yaml file.
 *
 * Missing keys keep their defaults; unknown keys are ignored.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Parse configuration text (used by load_project_config and tests)
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root = {});

/**
 * Find nstg.yaml by searching upward from a directory.
 *
 * @return Path to nstg.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "nstg.yaml";

}  // namespace nstg
