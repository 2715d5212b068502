// tierflow/tooling/invocation_log.hpp - JSONL audit of tool invocations
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "tierflow/tooling/tool_outcome.hpp"

namespace tierflow
{

inline constexpr const char * k_invocations_log_name = "skill-invocations.jsonl";

/**
 * Appends one JSON object per spawned tool to `<log_dir>/skill-invocations.jsonl`.
 *
 * A disabled log (no directory) ignores records. Write failures are logged
 * and otherwise ignored; the audit trail must not fail a phase.
 */
class InvocationLog
{
public:
  InvocationLog() = default;
  explicit InvocationLog(std::filesystem::path log_dir);

  [[nodiscard]] bool enabled() const noexcept { return !path_.empty(); }
  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  void record(
    const std::filesystem::path & tool, const std::vector<std::string> & args,
    const ToolOutcome & outcome) const;

private:
  std::filesystem::path path_;
};

}  // namespace tierflow
