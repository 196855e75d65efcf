// nstg/project/project_config.cpp - Project configuration implementation
//
#include "nstg/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>
#include <utility>

namespace nstg
{

namespace
{

/// Read an optional positive integer setting
bool read_count(
  const YAML::Node & section, const char * key, std::size_t & out, std::string & error)
{
  if (!section[key]) return true;
  const auto value = section[key].as<long long>();
  if (value < 0) {
    error = std::string("analysis.") + key + " must not be negative";
    return false;
  }
  out = static_cast<std::size_t>(value);
  return true;
}

std::optional<std::string> parse_analysis(const YAML::Node & node, AnalysisConfig & analysis)
{
  if (!node.IsMap()) return "analysis must be a map";

  std::string error;
  if (!read_count(node, "max_negative_space_regions", analysis.max_negative_space_regions, error) ||
      !read_count(node, "max_boundary_tests", analysis.max_boundary_tests, error) ||
      !read_count(node, "max_inputs_per_region", analysis.max_inputs_per_region, error) ||
      !read_count(node, "max_solutions_per_gap", analysis.max_solutions_per_gap, error)) {
    return error;
  }

  if (node["timeout_ms"]) {
    const auto timeout = node["timeout_ms"].as<long long>();
    if (timeout <= 0) return "analysis.timeout_ms must be positive";
    analysis.timeout_ms = static_cast<uint32_t>(timeout);
  }

  if (node["include_edge_cases"]) {
    analysis.include_edge_cases = node["include_edge_cases"].as<bool>();
  }
  if (node["smt_solver_enabled"]) {
    analysis.smt_solver_enabled = node["smt_solver_enabled"].as<bool>();
  }

  if (node["exploration_depth"]) {
    const int depth = node["exploration_depth"].as<int>();
    if (depth < 1 || depth > 3) return "analysis.exploration_depth must be 1, 2 or 3";
    analysis.exploration_depth = depth;
  }

  if (node["strategy"]) {
    const auto text = node["strategy"].as<std::string>();
    const auto strategy = parse_strategy(text);
    if (!strategy) {
      return "invalid analysis.strategy: '" + text +
             "' (must be 'balanced', 'boundary-first' or 'cardinality-first')";
    }
    analysis.strategy = *strategy;
  }

  return std::nullopt;
}

std::optional<std::string> parse_output(const YAML::Node & node, OutputConfig & output)
{
  if (!node.IsMap()) return "output must be a map";

  if (node["path"]) output.path = node["path"].as<std::string>();

  if (node["ordering"]) {
    const auto text = node["ordering"].as<std::string>();
    const auto ordering = parse_test_ordering(text);
    if (!ordering) {
      return "invalid output.ordering: '" + text +
             "' (must be 'priority', 'boundary-first' or 'error-first')";
    }
    output.ordering = *ordering;
  }
  return std::nullopt;
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  try {
    const YAML::Node root = YAML::Load(yaml_text);
    if (!root || root.IsNull()) return ConfigLoadResult::ok(std::move(config));
    if (!root.IsMap()) return ConfigLoadResult::fail("configuration root must be a map");

    if (root["project"] && root["project"]["name"]) {
      config.name = root["project"]["name"].as<std::string>();
    }

    if (root["analysis"]) {
      if (auto error = parse_analysis(root["analysis"], config.analysis)) {
        return ConfigLoadResult::fail(*error);
      }
    }

    if (root["output"]) {
      if (auto error = parse_output(root["output"], config.output)) {
        return ConfigLoadResult::fail(*error);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream file(config_path);
  if (!file.is_open()) {
    return ConfigLoadResult::fail("failed to open configuration file: " + config_path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  return parse_project_config(buffer.str(), fs::absolute(config_path).parent_path());
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
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace nstg
