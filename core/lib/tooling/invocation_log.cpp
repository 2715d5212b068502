// tierflow/tooling/invocation_log.cpp
//
#include "tierflow/tooling/invocation_log.hpp"

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <fstream>

namespace tierflow
{

InvocationLog::InvocationLog(std::filesystem::path log_dir)
: path_(log_dir.empty() ? std::filesystem::path() : log_dir / k_invocations_log_name)
{
}

void InvocationLog::record(
  const std::filesystem::path & tool, const std::vector<std::string> & args,
  const ToolOutcome & outcome) const
{
  if (!enabled()) return;

  const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  nlohmann::json entry{
    {"timestamp", fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now))},
    {"script", tool.filename().string()},
    {"script_path", tool.string()},
    {"args", args},
    {"status", std::string(to_string(outcome.status))},
    {"duration_s", outcome.duration.count()},
    {"stdout_bytes", outcome.stdout_bytes},
    {"stderr_bytes", outcome.stderr_bytes}};
  entry["returncode"] = outcome.exit_code ? nlohmann::json(*outcome.exit_code) : nlohmann::json();

  std::ofstream out(path_, std::ios::app);
  if (!out.is_open()) {
    spdlog::warn("cannot append to invocation log {}", path_.string());
    return;
  }
  out << entry.dump() << '\n';
}

}  // namespace tierflow
