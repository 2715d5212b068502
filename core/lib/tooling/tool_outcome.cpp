// tierflow/tooling/tool_outcome.cpp
//
#include "tierflow/tooling/tool_outcome.hpp"

#include <array>
#include <utility>

namespace tierflow
{

namespace
{

constexpr std::array<std::pair<ToolStatus, std::string_view>, 5> k_status_names = {{
  {ToolStatus::Complete, "complete"},
  {ToolStatus::Partial, "partial"},
  {ToolStatus::Error, "error"},
  {ToolStatus::Timeout, "timeout"},
  {ToolStatus::Skipped, "skipped"},
}};

}  // namespace

std::string_view to_string(ToolStatus status) noexcept
{
  for (const auto & [s, name] : k_status_names) {
    if (s == status) return name;
  }
  return "unknown";
}

std::optional<ToolStatus> tool_status_from_string(std::string_view name) noexcept
{
  for (const auto & [s, n] : k_status_names) {
    if (n == name) return s;
  }
  return std::nullopt;
}

nlohmann::json to_json(const ToolOutcome & outcome)
{
  nlohmann::json j;
  j["status"] = std::string(to_string(outcome.status));

  switch (outcome.payload_kind()) {
    case PayloadKind::Structured:
      j["output"] = std::get<nlohmann::json>(outcome.payload);
      break;
    case PayloadKind::RawText:
      j["output"] = std::get<RawText>(outcome.payload).text;
      break;
    case PayloadKind::Absent:
      break;
  }

  if (outcome.diagnostic) {
    j["stderr"] = *outcome.diagnostic;
  }
  if (outcome.exit_code) {
    j["exit_code"] = *outcome.exit_code;
  }
  j["duration_seconds"] = outcome.duration.count();
  return j;
}

}  // namespace tierflow
