// tierflow/basic/logging.cpp
//
#include "tierflow/basic/logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace tierflow
{

namespace
{

constexpr int k_max_search_levels = 10;

}  // namespace

std::optional<fs::path> find_log_dir(const fs::path & start)
{
  std::error_code ec;

  if (const char * env = std::getenv(k_log_dir_env); env && *env) {
    const fs::path dir(env);
    fs::create_directories(dir, ec);
    if (!ec) return dir;
  }

  fs::path current = fs::weakly_canonical(start, ec);
  if (ec) current = start;
  for (int i = 0; i < k_max_search_levels; ++i) {
    const fs::path analysis = current / "migration-analysis";
    if (fs::is_directory(analysis, ec)) {
      const fs::path logs = analysis / "logs";
      fs::create_directories(logs, ec);
      if (!ec) return logs;
      return std::nullopt;
    }
    if (current == current.parent_path()) break;
    current = current.parent_path();
  }

  return std::nullopt;
}

fs::path init_logging(const LoggingOptions & options)
{
  auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  stderr_sink->set_level(options.verbose ? spdlog::level::debug : spdlog::level::warn);

  std::vector<spdlog::sink_ptr> sinks{stderr_sink};

  fs::path log_dir;
  if (options.log_dir) {
    log_dir = *options.log_dir;
  } else if (auto found = find_log_dir(fs::current_path())) {
    log_dir = *found;
  }

  std::string file_sink_error;
  if (!log_dir.empty()) {
    try {
      auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        (log_dir / k_audit_log_name).string(), /*truncate*/ false);
      file_sink->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
      sinks.push_back(std::move(file_sink));
    } catch (const spdlog::spdlog_ex & e) {
      // Unwritable log directory: stderr only.
      file_sink_error = e.what();
      log_dir.clear();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("tierflow", sinks.begin(), sinks.end());
  logger->set_pattern("%Y-%m-%dT%H:%M:%S | %n | %-5l | %v");
  logger->set_level(spdlog::level::debug);
  spdlog::set_default_logger(std::move(logger));

  if (!file_sink_error.empty()) {
    spdlog::warn("audit log disabled: {}", file_sink_error);
  }
  return log_dir;
}

}  // namespace tierflow
