// tierflow/tooling/tool_invoker.hpp - Run an external tool, map it to ToolOutcome
//
// The invoker never interprets why a tool failed. Status comes only from
// whether the executable exists, its exit code, and whether its stdout is
// JSON.
//
#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tierflow/tooling/invocation_log.hpp"
#include "tierflow/tooling/tool_outcome.hpp"

namespace tierflow
{

struct ToolInvokerOptions
{
  /// Prefix the command with an interpreter (e.g. "python3") when set.
  std::optional<std::string> interpreter;

  /// Applied when invoke() is called without an explicit timeout.
  std::chrono::seconds default_timeout{300};

  /// Bound on raw-text payloads and captured stderr.
  size_t truncate_bytes = 500;
};

class ToolInvoker
{
public:
  ToolInvoker() = default;
  explicit ToolInvoker(ToolInvokerOptions options, InvocationLog log = {});

  /**
   * Invoke `tool_path args...` and wait for it.
   *
   * @return skipped if tool_path does not exist (nothing is spawned);
   *         timeout if the deadline expired; otherwise the exit-code mapping
   */
  [[nodiscard]] ToolOutcome invoke(
    const std::filesystem::path & tool_path, const std::vector<std::string> & args,
    std::optional<std::chrono::seconds> timeout = std::nullopt);

  /// Number of child processes started so far.
  [[nodiscard]] size_t spawn_count() const noexcept { return spawn_count_; }

  [[nodiscard]] const ToolInvokerOptions & options() const noexcept { return options_; }

private:
  ToolInvokerOptions options_;
  InvocationLog log_;
  size_t spawn_count_ = 0;
};

}  // namespace tierflow
