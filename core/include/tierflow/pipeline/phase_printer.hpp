// tierflow/pipeline/phase_printer.hpp
//
// Human-readable phase narration on stderr. Machine-readable output goes to
// the report files and stdout; nothing here is meant to be parsed.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "tierflow/pipeline/phase.hpp"
#include "tierflow/tooling/tool_outcome.hpp"

namespace tierflow
{

/**
 * Prints phase progress in the form:
 *
 *   [PHASE 2] Mechanical - Apply automated fixes
 *     Project root: /src/app
 *     -> Generating work items...
 *
 *   [PHASE 2 SUMMARY]
 *     Work items generated: complete
 *     Automated fixes applied: 4
 */
class PhasePrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to color statuses
   */
  explicit PhasePrinter(std::ostream & os, bool use_color = true);

  void banner(Phase phase, std::string_view title);
  void field(std::string_view label, std::string_view value);
  void progress(std::string_view description);
  void warning(std::string_view message);

  void summary_header(Phase phase);
  void status_line(std::string_view label, ToolStatus status);

  /// Closing remark, colored by the phase status.
  void conclusion(PhaseStatus status, std::string_view message);

private:
  void print_status(ToolStatus status);

  std::ostream & os_;
  bool use_color_;
};

/// Whether stderr is attached to a terminal.
[[nodiscard]] bool stderr_is_terminal() noexcept;

}  // namespace tierflow
