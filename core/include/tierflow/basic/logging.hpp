// tierflow/basic/logging.hpp - spdlog setup shared by the CLI and tests
//
// stderr gets warnings and above (everything with --verbose); the audit file
// `migration-audit.log` gets info and above when a log directory is known.
//
#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <optional>

namespace tierflow
{

inline constexpr const char * k_audit_log_name = "migration-audit.log";
inline constexpr const char * k_log_dir_env = "TIERFLOW_LOG_DIR";

struct LoggingOptions
{
  bool verbose = false;

  /// Explicit log directory; discovered with find_log_dir() when unset.
  std::optional<std::filesystem::path> log_dir;
};

/**
 * Locate the directory for audit logs.
 *
 * Search order:
 * 1. $TIERFLOW_LOG_DIR (created if missing)
 * 2. `migration-analysis/logs` below the nearest ancestor of `start` (up to
 *    ten levels) that has a `migration-analysis/` directory
 *
 * @return the directory, or std::nullopt for stderr-only logging
 */
[[nodiscard]] std::optional<std::filesystem::path> find_log_dir(
  const std::filesystem::path & start);

/**
 * Install the default "tierflow" logger.
 *
 * @return the resolved log directory (empty when logging to stderr only)
 */
std::filesystem::path init_logging(const LoggingOptions & options);

}  // namespace tierflow
