// tierflow/tooling/tool_outcome.hpp - Result of one external tool invocation
#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tierflow
{

// ============================================================================
// ToolStatus
// ============================================================================

enum class ToolStatus : uint8_t {
  Complete,  ///< exit 0
  Partial,   ///< exit 1: degraded but usable
  Error,     ///< any other exit, signal, or spawn failure
  Timeout,   ///< killed after the deadline
  Skipped,   ///< executable not found; nothing was spawned
};

[[nodiscard]] std::string_view to_string(ToolStatus status) noexcept;

/// Inverse of to_string; std::nullopt for unknown names.
[[nodiscard]] std::optional<ToolStatus> tool_status_from_string(std::string_view name) noexcept;

/// complete or partial
[[nodiscard]] constexpr bool is_usable(ToolStatus status) noexcept
{
  return status == ToolStatus::Complete || status == ToolStatus::Partial;
}

/// Fixed exit-code contract: 0 -> complete, 1 -> partial, otherwise error.
[[nodiscard]] constexpr ToolStatus status_for_exit_code(int exit_code) noexcept
{
  if (exit_code == 0) return ToolStatus::Complete;
  if (exit_code == 1) return ToolStatus::Partial;
  return ToolStatus::Error;
}

// ============================================================================
// ToolPayload
// ============================================================================

/// Raw stdout kept when it is not valid JSON.
struct RawText
{
  std::string text;
};

/// monostate (absent) | structured JSON | raw text
using ToolPayload = std::variant<std::monostate, nlohmann::json, RawText>;

enum class PayloadKind : uint8_t {
  Absent,
  Structured,
  RawText,
};

// ============================================================================
// ToolOutcome
// ============================================================================

struct ToolOutcome
{
  ToolStatus status = ToolStatus::Skipped;
  ToolPayload payload;

  /// Truncated stderr on error, or the reason for skip/spawn failure.
  std::optional<std::string> diagnostic;

  /// Set when the process exited normally.
  std::optional<int> exit_code;

  std::chrono::duration<double> duration{0.0};
  size_t stdout_bytes = 0;
  size_t stderr_bytes = 0;

  [[nodiscard]] PayloadKind payload_kind() const noexcept
  {
    return static_cast<PayloadKind>(payload.index());
  }

  /// Structured payload, or nullptr.
  [[nodiscard]] const nlohmann::json * structured() const noexcept
  {
    return std::get_if<nlohmann::json>(&payload);
  }

  /// Structured payload if it is a JSON object, else nullptr.
  [[nodiscard]] const nlohmann::json * structured_object() const noexcept
  {
    const auto * j = structured();
    return (j && j->is_object()) ? j : nullptr;
  }
};

/// Report form: {"status", "output"?, "stderr"?, "exit_code"?, "duration_seconds"}
[[nodiscard]] nlohmann::json to_json(const ToolOutcome & outcome);

}  // namespace tierflow
