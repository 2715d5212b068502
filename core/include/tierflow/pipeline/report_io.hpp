// tierflow/pipeline/report_io.hpp - Reading and writing JSON report files
#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace tierflow
{

/**
 * Write `document` to `path` with two-space indentation and a trailing newline.
 *
 * Parent directories are created as needed.
 *
 * @throws std::runtime_error if the file cannot be written
 */
void write_report(const std::filesystem::path & path, const nlohmann::json & document);

/**
 * Read a JSON document.
 *
 * @param error set to a message when std::nullopt is returned
 * @return std::nullopt if the file is missing, unreadable or not valid JSON
 */
[[nodiscard]] std::optional<nlohmann::json> read_json_file(
  const std::filesystem::path & path, std::string * error = nullptr);

}  // namespace tierflow
