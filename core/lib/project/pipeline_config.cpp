// tierflow/project/pipeline_config.cpp - Pipeline configuration implementation
//
#include "tierflow/project/pipeline_config.hpp"

#include <yaml-cpp/yaml.h>

namespace tierflow
{

namespace
{

/// Parse a list of strings; a single scalar is accepted as a one-element list.
bool parse_string_list(
  const YAML::Node & node, const char * field, std::vector<std::string> & out, std::string & error)
{
  if (node.IsScalar()) {
    out = {node.as<std::string>()};
    return true;
  }
  if (!node.IsSequence()) {
    error = std::string(field) + " must be a list";
    return false;
  }

  out.clear();
  for (const auto & entry : node) {
    if (!entry.IsScalar()) {
      error = std::string(field) + " entries must be strings";
      return false;
    }
    out.push_back(entry.as<std::string>());
  }
  if (out.empty()) {
    error = std::string(field) + " must not be empty";
    return false;
  }
  return true;
}

bool parse_tools(const YAML::Node & tools, ToolsConfig & config, std::string & error)
{
  if (!tools.IsMap()) {
    error = "tools must be a map";
    return false;
  }

  if (tools["dir"]) {
    config.dir = tools["dir"].as<std::string>();
  }
  if (tools["interpreter"]) {
    config.interpreter = tools["interpreter"].as<std::string>();
  }
  if (tools["timeout_seconds"]) {
    const auto seconds = tools["timeout_seconds"].as<long long>();
    if (seconds <= 0) {
      error = "tools.timeout_seconds must be positive";
      return false;
    }
    config.timeout = std::chrono::seconds(seconds);
  }

  const std::pair<const char *, std::filesystem::path *> paths[] = {
    {"injector", &config.injector},
    {"lint_baseline", &config.lint_baseline},
    {"test_scaffolds", &config.test_scaffolds},
    {"work_item_generator", &config.work_item_generator},
    {"fixer", &config.fixer},
    {"library_replacement", &config.library_replacement},
  };
  for (const auto & [key, target] : paths) {
    if (tools[key]) {
      *target = tools[key].as<std::string>();
    }
  }
  return true;
}

bool parse_tiers(const YAML::Node & tiers, TiersConfig & config, std::string & error)
{
  if (!tiers.IsMap()) {
    error = "tiers must be a map";
    return false;
  }

  if (tiers["automated"] &&
      !parse_string_list(tiers["automated"], "tiers.automated", config.labels.automated, error)) {
    return false;
  }
  if (tiers["first"] &&
      !parse_string_list(tiers["first"], "tiers.first", config.labels.first, error)) {
    return false;
  }
  if (tiers["second"] &&
      !parse_string_list(tiers["second"], "tiers.second", config.labels.second, error)) {
    return false;
  }

  if (tiers["sample_cap"]) {
    const auto cap = tiers["sample_cap"].as<long long>();
    if (cap <= 0) {
      error = "tiers.sample_cap must be positive";
      return false;
    }
    config.sample_cap = static_cast<size_t>(cap);
  }

  const std::pair<const char *, uint64_t *> weights[] = {
    {"first_weight", &config.first_weight},
    {"second_weight", &config.second_weight},
  };
  for (const auto & [key, target] : weights) {
    if (!tiers[key]) continue;
    const auto value = tiers[key].as<long long>();
    if (value < 0) {
      error = std::string("tiers.") + key + " must not be negative";
      return false;
    }
    *target = static_cast<uint64_t>(value);
  }
  return true;
}

}  // namespace

PipelineConfig default_pipeline_config(const std::filesystem::path & base_dir)
{
  PipelineConfig config;
  config.tools.dir = base_dir / config.tools.dir;
  return config;
}

ConfigLoadResult load_pipeline_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  PipelineConfig config;
  config.config_root = fs::absolute(config_path).parent_path();

  // An empty document is a valid, all-defaults configuration.
  if (root.IsNull()) {
    config.tools.dir = config.config_root / config.tools.dir;
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  std::string error;
  try {
    // Parse 'tools' section
    if (root["tools"] && !parse_tools(root["tools"], config.tools, error)) {
      return ConfigLoadResult::fail(error);
    }

    // Parse 'grammars' section
    if (root["grammars"]) {
      const auto & grammars = root["grammars"];
      if (grammars["search_paths"]) {
        if (!grammars["search_paths"].IsSequence()) {
          return ConfigLoadResult::fail("grammars.search_paths must be a list");
        }
        for (const auto & dir : grammars["search_paths"]) {
          fs::path p = dir.as<std::string>();
          config.grammars.search_paths.push_back(p.is_absolute() ? p : config.config_root / p);
        }
      }
    }

    // Parse 'tiers' section
    if (root["tiers"] && !parse_tiers(root["tiers"], config.tiers, error)) {
      return ConfigLoadResult::fail(error);
    }

    // Parse 'phases' section
    if (root["phases"] && root["phases"]["partial_policy"]) {
      const auto name = root["phases"]["partial_policy"].as<std::string>();
      const auto policy = partial_policy_from_string(name);
      if (!policy) {
        return ConfigLoadResult::fail(
          "invalid phases.partial_policy: '" + name + "' (must be 'proceed' or 'caution')");
      }
      config.partial_policy = *policy;
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  if (config.tools.dir.is_relative()) {
    config.tools.dir = config.config_root / config.tools.dir;
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_pipeline_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) return std::nullopt;

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_pipeline_config_file_name;
    if (fs::exists(candidate, ec)) {
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

}  // namespace tierflow
