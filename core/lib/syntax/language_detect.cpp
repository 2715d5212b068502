// tierflow/syntax/language_detect.cpp
//
#include "tierflow/syntax/language_detect.hpp"

#include <array>
#include <fstream>
#include <utility>

#include "tierflow/basic/text.hpp"

namespace tierflow
{

namespace
{

struct ExtensionEntry
{
  std::string_view extension;
  std::string_view language;
};

// `.h` is ambiguous; C is the conservative choice.
constexpr std::array<ExtensionEntry, 22> k_extension_map = {{
  {".py", "python"},   {".java", "java"},    {".js", "javascript"}, {".ts", "typescript"},
  {".tsx", "typescript"}, {".c", "c"},       {".h", "c"},           {".cpp", "cpp"},
  {".cc", "cpp"},      {".cxx", "cpp"},      {".hpp", "cpp"},       {".rs", "rust"},
  {".go", "go"},       {".rb", "ruby"},      {".sh", "bash"},       {".pl", "perl"},
  {".php", "php"},     {".swift", "swift"},  {".kt", "kotlin"},     {".scala", "scala"},
  {".groovy", "groovy"}, {".pyw", "python"},
}};

// Checked in order; "sh" is a substring of "bash" and must come last.
constexpr std::array<std::pair<std::string_view, std::string_view>, 7> k_shebang_map = {{
  {"python", "python"},
  {"node", "javascript"},
  {"ruby", "ruby"},
  {"perl", "perl"},
  {"php", "php"},
  {"bash", "bash"},
  {"sh", "bash"},
}};

}  // namespace

std::optional<std::string> language_for_extension(std::string_view extension)
{
  const std::string ext = to_lower(extension);
  for (const auto & entry : k_extension_map) {
    if (entry.extension == ext) return std::string(entry.language);
  }
  return std::nullopt;
}

std::optional<std::string> language_for_shebang(std::string_view first_line)
{
  if (first_line.substr(0, 2) != "#!") return std::nullopt;

  const std::string line = to_lower(first_line);
  for (const auto & [needle, language] : k_shebang_map) {
    if (line.find(needle) != std::string::npos) return std::string(language);
  }
  return std::nullopt;
}

std::optional<std::string> detect_language(const std::filesystem::path & file)
{
  if (auto lang = language_for_extension(file.extension().string())) {
    return lang;
  }

  std::ifstream in(file, std::ios::binary);
  if (!in.is_open()) return std::nullopt;

  std::string first_line;
  std::getline(in, first_line);
  if (first_line.size() > 256) first_line.resize(256);
  return language_for_shebang(first_line);
}

}  // namespace tierflow
