// tierflow/pipeline/orchestrator.hpp - Runs the migration phases
//
// Each phase invokes its external tools in a fixed order, records one status
// per step, writes its artifacts into the output directory and folds the step
// statuses into the phase status (which is also the process exit code).
//
#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tierflow/pipeline/phase.hpp"
#include "tierflow/pipeline/tier_classifier.hpp"
#include "tierflow/project/pipeline_config.hpp"
#include "tierflow/tooling/tool_invoker.hpp"

namespace tierflow
{

class PhasePrinter;

inline constexpr const char * k_default_output_dir = "./migration_output";
inline constexpr const char * k_default_raw_scan = "raw-scan.json";

// Artifact names inside the output directory.
inline constexpr const char * k_injection_report = "injection-report.json";
inline constexpr const char * k_lint_baseline = "lint-baseline.json";
inline constexpr const char * k_test_scaffolds = "test-scaffolds.json";
inline constexpr const char * k_work_items = "work-items.json";
inline constexpr const char * k_library_replacement_report = "library-replacement-report.json";
inline constexpr const char * k_review_brief = "semantic-review-brief.json";

/// `<phase>-summary.json`
[[nodiscard]] std::string summary_file_name(Phase phase);

struct PhaseRequest
{
  std::filesystem::path project_root;

  /// Phase 0 scan; Mechanical falls back to k_default_raw_scan.
  std::optional<std::filesystem::path> raw_scan;

  std::filesystem::path output_dir = k_default_output_dir;
};

struct SemanticRequest
{
  /// Defaults to `<output_dir>/work-items.json`.
  std::optional<std::filesystem::path> work_items;

  std::optional<std::filesystem::path> raw_scan;
  std::filesystem::path output_dir = k_default_output_dir;
};

struct SemanticPrepResult
{
  ReviewBrief brief;
  std::filesystem::path brief_path;

  /// Whether the work-items file existed.
  bool work_items_found = false;

  /// Number of entries in the raw scan's `patterns` object (0 without a scan).
  size_t scan_patterns = 0;

  /// Always Proceed: preparing a brief never blocks.
  PhaseStatus status = PhaseStatus::Proceed;

  /// Printed to stdout by the CLI.
  [[nodiscard]] nlohmann::json summary() const;
};

class Orchestrator
{
public:
  /**
   * @param config Tool locations, tier labels and partial policy
   * @param invoker Used for every tool invocation (shared so spawns can be counted)
   * @param printer Narration target; nullptr for silent runs
   */
  Orchestrator(PipelineConfig config, ToolInvoker & invoker, PhasePrinter * printer = nullptr);

  /// Phase 1: future imports, lint baseline, test scaffolds.
  PhaseReport run_foundation(const PhaseRequest & request);

  /// Phase 2: work-item generation, automated fixes, library replacement.
  PhaseReport run_mechanical(const PhaseRequest & request);

  /// Phase 3: build the review brief from the generated work items.
  SemanticPrepResult run_semantic_prep(const SemanticRequest & request);

  [[nodiscard]] const PipelineConfig & config() const noexcept { return config_; }

private:
  ToolOutcome run_tool(
    std::string_view description, const std::filesystem::path & tool,
    const std::vector<std::string> & args);

  /// Write a usable outcome's JSON-object payload to `file_name`.
  void save_payload(
    PhaseReport & report, const ToolOutcome & outcome, std::string_view file_name);

  void write_summary(PhaseReport & report);
  void narrate_artifacts(const std::vector<std::filesystem::path> & artifacts);

  PipelineConfig config_;
  ToolInvoker & invoker_;
  PhasePrinter * printer_;
};

}  // namespace tierflow
