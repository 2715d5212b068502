// tierflow/tooling/tool_invoker.cpp
//
#include "tierflow/tooling/tool_invoker.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstring>
#include <utility>

#include "tierflow/tooling/process.hpp"

namespace fs = std::filesystem;

namespace tierflow
{

namespace
{

std::string truncate(const std::string & s, size_t limit)
{
  return s.size() > limit ? s.substr(0, limit) : s;
}

ToolPayload payload_from_stdout(const std::string & out, size_t limit)
{
  // allow_exceptions=false: malformed output is expected and not an error.
  nlohmann::json parsed = nlohmann::json::parse(out, nullptr, /*allow_exceptions*/ false);
  if (!parsed.is_discarded()) {
    return ToolPayload(std::in_place_type<nlohmann::json>, std::move(parsed));
  }
  return ToolPayload(std::in_place_type<RawText>, RawText{truncate(out, limit)});
}

}  // namespace

ToolInvoker::ToolInvoker(ToolInvokerOptions options, InvocationLog log)
: options_(std::move(options)), log_(std::move(log))
{
}

ToolOutcome ToolInvoker::invoke(
  const fs::path & tool_path, const std::vector<std::string> & args,
  std::optional<std::chrono::seconds> timeout)
{
  ToolOutcome outcome;

  std::error_code ec;
  if (!fs::exists(tool_path, ec)) {
    spdlog::warn("tool not found, skipping: {}", tool_path.string());
    outcome.status = ToolStatus::Skipped;
    outcome.diagnostic = "tool not found: " + tool_path.string();
    return outcome;
  }

  std::vector<std::string> argv;
  argv.reserve(args.size() + 2);
  if (options_.interpreter && !options_.interpreter->empty()) {
    argv.push_back(*options_.interpreter);
  }
  // A bare name would be looked up on PATH; the existence check above was relative.
  argv.push_back(
    tool_path.has_parent_path() ? tool_path.string() : (fs::path(".") / tool_path).string());
  argv.insert(argv.end(), args.begin(), args.end());

  const auto budget = timeout.value_or(options_.default_timeout);
  spdlog::info(
    "invoking {} ({} args, timeout {}s)", tool_path.filename().string(), args.size(),
    budget.count());

  ++spawn_count_;
  const ProcessResult proc = run_process(argv, budget);

  outcome.duration = proc.duration;
  outcome.stdout_bytes = proc.stdout_text.size();
  outcome.stderr_bytes = proc.stderr_text.size();

  switch (proc.termination) {
    case ProcessResult::Termination::TimedOut:
      spdlog::error("tool timed out after {}s: {}", budget.count(), tool_path.string());
      outcome.status = ToolStatus::Timeout;
      break;

    case ProcessResult::Termination::SpawnFailed:
      spdlog::error("tool execution error: {}: {}", tool_path.string(), proc.spawn_error);
      outcome.status = ToolStatus::Error;
      outcome.diagnostic = proc.spawn_error;
      break;

    case ProcessResult::Termination::Signaled:
      outcome.status = ToolStatus::Error;
      outcome.diagnostic = proc.stderr_text.empty()
                             ? std::string("terminated by signal ") + ::strsignal(proc.signal)
                             : truncate(proc.stderr_text, options_.truncate_bytes);
      break;

    case ProcessResult::Termination::Exited:
      outcome.exit_code = proc.exit_code;
      outcome.status = status_for_exit_code(proc.exit_code);
      if (is_usable(outcome.status)) {
        outcome.payload = payload_from_stdout(proc.stdout_text, options_.truncate_bytes);
      } else {
        outcome.diagnostic = truncate(proc.stderr_text, options_.truncate_bytes);
      }
      break;
  }

  log_.record(tool_path, args, outcome);
  return outcome;
}

}  // namespace tierflow
