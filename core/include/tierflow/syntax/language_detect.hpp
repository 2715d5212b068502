// tierflow/syntax/language_detect.hpp - Guess a file's language
//
// Two passes: file extension first, then the shebang line for files whose
// extension is unknown or missing.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace tierflow
{

/// Language for a file extension (with leading dot, case-insensitive).
[[nodiscard]] std::optional<std::string> language_for_extension(std::string_view extension);

/// Language named by a "#!" line, e.g. "#!/usr/bin/env python3" -> "python".
[[nodiscard]] std::optional<std::string> language_for_shebang(std::string_view first_line);

/**
 * Detect the language of a file on disk.
 *
 * @return normalized language name, or std::nullopt if undetermined
 */
[[nodiscard]] std::optional<std::string> detect_language(const std::filesystem::path & file);

}  // namespace tierflow
