// tierflow/pipeline/phase_printer.cpp - Phase narration
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "tierflow/pipeline/phase_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>
#include <unistd.h>

#include <ostream>
#include <rang.hpp>

namespace tierflow
{

namespace
{

std::string_view phase_title(Phase phase)
{
  switch (phase) {
    case Phase::Foundation:
      return "Foundation";
    case Phase::Mechanical:
      return "Mechanical";
    case Phase::SemanticPrep:
      return "Semantic";
  }
  return "";
}

}  // namespace

// rang's process-wide control mode is left untouched; every color write is
// gated on use_color_ instead.
PhasePrinter::PhasePrinter(std::ostream & os, bool use_color) : os_(os), use_color_(use_color)
{
}

void PhasePrinter::banner(Phase phase, std::string_view title)
{
  os_ << "\n";
  if (use_color_) os_ << rang::style::bold;
  fmt::print(os_, "[PHASE {}] {} - {}", phase_number(phase), phase_title(phase), title);
  if (use_color_) os_ << rang::style::reset;
  os_ << "\n";
}

void PhasePrinter::field(std::string_view label, std::string_view value)
{
  fmt::print(os_, "  {}: {}\n", label, value);
}

void PhasePrinter::progress(std::string_view description)
{
  if (use_color_) {
    os_ << "  " << rang::fg::cyan << "->" << rang::fg::reset;
  } else {
    os_ << "  ->";
  }
  fmt::print(os_, " {}...\n", description);
}

void PhasePrinter::warning(std::string_view message)
{
  if (use_color_) {
    os_ << "  " << rang::fg::yellow << "Warning" << rang::fg::reset;
  } else {
    os_ << "  Warning";
  }
  fmt::print(os_, ": {}\n", message);
}

void PhasePrinter::summary_header(Phase phase)
{
  os_ << "\n";
  if (use_color_) os_ << rang::style::bold;
  fmt::print(os_, "[PHASE {} SUMMARY]", phase_number(phase));
  if (use_color_) os_ << rang::style::reset;
  os_ << "\n";
}

void PhasePrinter::status_line(std::string_view label, ToolStatus status)
{
  fmt::print(os_, "  {}: ", label);
  print_status(status);
  os_ << "\n";
}

void PhasePrinter::conclusion(PhaseStatus status, std::string_view message)
{
  os_ << "\n";
  if (use_color_) {
    switch (status) {
      case PhaseStatus::Proceed:
        os_ << rang::fg::green;
        break;
      case PhaseStatus::Caution:
        os_ << rang::fg::yellow;
        break;
      case PhaseStatus::Blocked:
        os_ << rang::fg::red;
        break;
    }
    os_ << message << rang::fg::reset << "\n";
  } else {
    os_ << message << "\n";
  }
}

void PhasePrinter::print_status(ToolStatus status)
{
  const std::string_view text = to_string(status);
  if (!use_color_) {
    os_ << text;
    return;
  }

  switch (status) {
    case ToolStatus::Complete:
      os_ << rang::fg::green;
      break;
    case ToolStatus::Partial:
    case ToolStatus::Skipped:
    case ToolStatus::Timeout:
      os_ << rang::fg::yellow;
      break;
    case ToolStatus::Error:
      os_ << rang::style::bold << rang::fg::red;
      break;
  }
  os_ << text << rang::style::reset << rang::fg::reset;
}

bool stderr_is_terminal() noexcept { return ::isatty(STDERR_FILENO) == 1; }

}  // namespace tierflow
