// tierflow/pipeline/phase.cpp
//
#include "tierflow/pipeline/phase.hpp"

#include <algorithm>

#include "tierflow/basic/text.hpp"

namespace tierflow
{

std::string_view to_string(Phase phase) noexcept
{
  switch (phase) {
    case Phase::Foundation:
      return "foundation";
    case Phase::Mechanical:
      return "mechanical";
    case Phase::SemanticPrep:
      return "semantic";
  }
  return "foundation";
}

std::string_view to_string(PartialPolicy policy) noexcept
{
  return policy == PartialPolicy::Caution ? "caution" : "proceed";
}

std::optional<PartialPolicy> partial_policy_from_string(std::string_view name)
{
  const std::string key = normalize_key(name);
  if (key == "proceed") return PartialPolicy::Proceed;
  if (key == "caution") return PartialPolicy::Caution;
  return std::nullopt;
}

PhaseStatus aggregate_status(const std::vector<ToolStatus> & statuses, PartialPolicy policy)
{
  const auto has = [&](ToolStatus s) {
    return std::find(statuses.begin(), statuses.end(), s) != statuses.end();
  };

  if (has(ToolStatus::Error)) return PhaseStatus::Blocked;

  if (std::all_of(statuses.begin(), statuses.end(), is_usable)) {
    if (policy == PartialPolicy::Caution && has(ToolStatus::Partial)) {
      return PhaseStatus::Caution;
    }
    return PhaseStatus::Proceed;
  }
  return PhaseStatus::Caution;
}

void PhaseReport::add_step(std::string name, ToolStatus status)
{
  steps.push_back(StepRecord{std::move(name), status});
}

void PhaseReport::finish(PartialPolicy policy)
{
  std::vector<ToolStatus> statuses;
  statuses.reserve(steps.size());
  for (const auto & step : steps) {
    statuses.push_back(step.status);
  }
  status = aggregate_status(statuses, policy);
}

std::optional<ToolStatus> PhaseReport::step_status(std::string_view name) const
{
  for (const auto & step : steps) {
    if (step.name == name) return step.status;
  }
  return std::nullopt;
}

nlohmann::json to_json(const PhaseReport & report)
{
  nlohmann::json steps = nlohmann::json::object();
  for (const auto & step : report.steps) {
    steps[step.name] = std::string(to_string(step.status));
  }

  nlohmann::json j{
    {"phase", std::string(to_string(report.phase))},
    {"project_root", report.project_root.string()},
    {"output_dir", report.output_dir.string()},
    {"steps", std::move(steps)},
  };
  for (const auto & [key, value] : report.counters.items()) {
    j[key] = value;
  }
  j["exit_status"] = exit_code(report.status);
  return j;
}

}  // namespace tierflow
