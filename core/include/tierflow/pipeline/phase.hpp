// tierflow/pipeline/phase.hpp - Phases, step records and status aggregation
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tierflow/tooling/tool_outcome.hpp"

namespace tierflow
{

// ============================================================================
// Phase
// ============================================================================

/// Executed in declaration order; there is no automatic re-entry.
enum class Phase : uint8_t {
  Foundation,
  Mechanical,
  SemanticPrep,
};

/// "foundation", "mechanical", "semantic"
[[nodiscard]] std::string_view to_string(Phase phase) noexcept;

/// 1-based position used in narration ("[PHASE 2]").
[[nodiscard]] constexpr int phase_number(Phase phase) noexcept
{
  return static_cast<int>(phase) + 1;
}

// ============================================================================
// Status aggregation
// ============================================================================

/// How a `partial` step affects the phase status.
enum class PartialPolicy : uint8_t {
  Proceed,  ///< partial counts like complete
  Caution,  ///< any partial yields at least Caution
};

[[nodiscard]] std::string_view to_string(PartialPolicy policy) noexcept;
[[nodiscard]] std::optional<PartialPolicy> partial_policy_from_string(std::string_view name);

/// Doubles as the process exit code.
enum class PhaseStatus : int {
  Proceed = 0,
  Caution = 1,
  Blocked = 2,
};

[[nodiscard]] constexpr int exit_code(PhaseStatus status) noexcept
{
  return static_cast<int>(status);
}

/**
 * Fold step statuses into a phase status.
 *
 * - any error                      -> Blocked
 * - all complete/partial (or none) -> Proceed
 * - otherwise (timeout, skipped)   -> Caution
 *
 * Under PartialPolicy::Caution a partial step raises Proceed to Caution.
 */
[[nodiscard]] PhaseStatus aggregate_status(
  const std::vector<ToolStatus> & statuses, PartialPolicy policy = PartialPolicy::Proceed);

// ============================================================================
// PhaseReport
// ============================================================================

struct StepRecord
{
  std::string name;
  ToolStatus status = ToolStatus::Skipped;
};

/**
 * Summary of one phase execution, written as `<phase>-summary.json`.
 */
struct PhaseReport
{
  Phase phase = Phase::Foundation;
  std::filesystem::path project_root;
  std::filesystem::path output_dir;

  /// In execution order.
  std::vector<StepRecord> steps;

  /// Phase-specific counters, merged into the top level of the JSON form.
  nlohmann::json counters = nlohmann::json::object();

  PhaseStatus status = PhaseStatus::Proceed;

  /// Files written by this phase, in write order.
  std::vector<std::filesystem::path> artifacts;

  /// Record a step; the phase status is recomputed by finish().
  void add_step(std::string name, ToolStatus status);

  /// Aggregate the recorded step statuses into `status`.
  void finish(PartialPolicy policy);

  [[nodiscard]] std::optional<ToolStatus> step_status(std::string_view name) const;
};

/// {"phase", "project_root", "output_dir", "steps": {name: status}, counters...}
[[nodiscard]] nlohmann::json to_json(const PhaseReport & report);

}  // namespace tierflow
