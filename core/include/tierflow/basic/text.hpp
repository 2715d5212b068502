// tierflow/basic/text.hpp - Small string helpers
#pragma once

#include <string>
#include <string_view>

namespace tierflow
{

/// ASCII lower-case copy.
[[nodiscard]] std::string to_lower(std::string_view s);

/// Strip leading/trailing whitespace.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

/// trim() then to_lower(); the comparison key for names and labels.
[[nodiscard]] inline std::string normalize_key(std::string_view s) { return to_lower(trim(s)); }

}  // namespace tierflow
