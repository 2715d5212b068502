// tierflow/project/pipeline_config.hpp - Pipeline configuration (tierflow.yaml)
//
// Parses and validates tierflow.yaml. Every field is optional; a missing
// file yields the defaults below.
//
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tierflow/pipeline/phase.hpp"
#include "tierflow/pipeline/work_item.hpp"

namespace tierflow
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * External tools invoked by the phases. Relative tool paths are resolved
 * against `dir`; a relative `dir` is resolved against the config file's
 * directory (or the working directory when there is no config file).
 */
struct ToolsConfig
{
  std::filesystem::path dir = "skills";

  /// e.g. "python3" for script tools without an executable bit
  std::optional<std::string> interpreter;

  std::chrono::seconds timeout{300};

  std::filesystem::path injector = "py2to3-future-imports-injector/scripts/inject_futures.py";
  std::filesystem::path lint_baseline = "py2to3-lint-baseline-generator/scripts/run_lint.py";
  std::filesystem::path test_scaffolds = "py2to3-test-scaffold-generator/scripts/generate_tests.py";
  std::filesystem::path work_item_generator = "work-item-generator/scripts/generate_work_items.py";
  std::filesystem::path fixer = "haiku-pattern-fixer/scripts/apply_fix.py";
  std::filesystem::path library_replacement = "py2to3-library-replacement/scripts/replace_libs.py";

  /// `dir / tool` unless `tool` is absolute.
  [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path & tool) const
  {
    return tool.is_absolute() ? tool : dir / tool;
  }
};

/**
 * Extra locations for grammar shared objects.
 */
struct GrammarsConfig
{
  std::vector<std::filesystem::path> search_paths;
};

/**
 * Tier labels and review-brief sizing.
 */
struct TiersConfig
{
  TierLabels labels;
  size_t sample_cap = 20;
  uint64_t first_weight = 300;
  uint64_t second_weight = 500;
};

/**
 * Complete pipeline configuration (tierflow.yaml).
 */
struct PipelineConfig
{
  ToolsConfig tools;
  GrammarsConfig grammars;
  TiersConfig tiers;
  PartialPolicy partial_policy = PartialPolicy::Proceed;

  /// Directory containing tierflow.yaml (empty when using defaults)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a pipeline configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  PipelineConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(PipelineConfig cfg)
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
 * Load a pipeline configuration from a tierflow.yaml file.
 *
 * @param config_path Path to tierflow.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_pipeline_config(const std::filesystem::path & config_path);

/**
 * Find tierflow.yaml by searching upward from start_dir to the filesystem root.
 *
 * @return Path to tierflow.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_pipeline_config(
  const std::filesystem::path & start_dir);

/**
 * Defaults with tool paths anchored at `base_dir`.
 */
[[nodiscard]] PipelineConfig default_pipeline_config(const std::filesystem::path & base_dir);

/**
 * Default name of the pipeline configuration file.
 */
inline constexpr const char * k_pipeline_config_file_name = "tierflow.yaml";

}  // namespace tierflow
