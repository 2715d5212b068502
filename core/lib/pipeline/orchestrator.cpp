// tierflow/pipeline/orchestrator.cpp - Phase sequencing and artifacts
//
#include "tierflow/pipeline/orchestrator.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

#include "tierflow/pipeline/phase_printer.hpp"
#include "tierflow/pipeline/report_io.hpp"
#include "tierflow/pipeline/work_item.hpp"

namespace fs = std::filesystem;

namespace tierflow
{

namespace
{

void ensure_output_dir(const fs::path & dir)
{
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error(
      "cannot create output directory " + dir.string() + ": " + ec.message());
  }
}

/// Copy `payload[key]` into `counters[as]` when the outcome carries it.
void copy_counter(
  nlohmann::json & counters, const ToolOutcome & outcome, const char * key, const char * as)
{
  const nlohmann::json * payload = outcome.structured_object();
  if (!payload) return;
  if (const auto it = payload->find(key); it != payload->end()) {
    counters[as] = *it;
  }
}

std::string counter_text(const nlohmann::json & counters, const char * key)
{
  const auto it = counters.find(key);
  if (it == counters.end()) return {};
  return it->is_string() ? it->get<std::string>() : it->dump();
}

}  // namespace

std::string summary_file_name(Phase phase)
{
  return fmt::format("{}-summary.json", to_string(phase));
}

nlohmann::json SemanticPrepResult::summary() const
{
  return nlohmann::json{
    {"phase", std::string(to_string(Phase::SemanticPrep))},
    {"status", "brief_prepared"},
    {"first_tier_items", brief.first.count},
    {"second_tier_items", brief.second.count},
    {"automated_items", brief.automated_count},
    {"scan_patterns", scan_patterns},
    {"brief_file", brief_path.string()},
    {"next_action", "Review brief-prepared items with the reasoning tiers and apply fixes"},
    {"exit_status", exit_code(status)}};
}

Orchestrator::Orchestrator(PipelineConfig config, ToolInvoker & invoker, PhasePrinter * printer)
: config_(std::move(config)), invoker_(invoker), printer_(printer)
{
}

// ============================================================================
// Helpers
// ============================================================================

ToolOutcome Orchestrator::run_tool(
  std::string_view description, const fs::path & tool, const std::vector<std::string> & args)
{
  if (printer_) printer_->progress(description);

  ToolOutcome outcome = invoker_.invoke(tool, args);
  if (outcome.status == ToolStatus::Skipped) {
    spdlog::info("{}: skipped ({})", description, outcome.diagnostic.value_or("not found"));
  } else {
    spdlog::info(
      "{}: {} in {:.2f}s", description, to_string(outcome.status), outcome.duration.count());
  }
  if (outcome.status == ToolStatus::Error && outcome.diagnostic) {
    spdlog::warn("{} failed: {}", description, *outcome.diagnostic);
  }
  return outcome;
}

void Orchestrator::save_payload(
  PhaseReport & report, const ToolOutcome & outcome, std::string_view file_name)
{
  if (!is_usable(outcome.status)) return;
  const nlohmann::json * payload = outcome.structured_object();
  if (!payload) return;

  const fs::path path = report.output_dir / file_name;
  write_report(path, *payload);
  report.artifacts.push_back(path);
}

void Orchestrator::write_summary(PhaseReport & report)
{
  report.finish(config_.partial_policy);

  const fs::path path = report.output_dir / summary_file_name(report.phase);
  write_report(path, to_json(report));
  report.artifacts.push_back(path);

  spdlog::info(
    "phase {} finished with status {}", to_string(report.phase), exit_code(report.status));
}

void Orchestrator::narrate_artifacts(const std::vector<fs::path> & artifacts)
{
  if (!printer_) return;

  std::string names;
  for (const auto & path : artifacts) {
    if (!names.empty()) names += ", ";
    names += path.filename().string();
  }
  printer_->field("Output files", names.empty() ? "(none)" : names);
}

// ============================================================================
// Phase 1: Foundation
// ============================================================================

PhaseReport Orchestrator::run_foundation(const PhaseRequest & request)
{
  PhaseReport report;
  report.phase = Phase::Foundation;
  report.project_root = request.project_root;
  report.output_dir = request.output_dir;

  if (printer_) {
    printer_->banner(Phase::Foundation, "Prepare codebase for migration");
    printer_->field("Project root", request.project_root.string());
    printer_->field("Raw scan", request.raw_scan ? request.raw_scan->string() : "(none)");
    printer_->field("Output dir", request.output_dir.string());
  }
  spdlog::info("phase foundation: root={} output={}", request.project_root.string(),
               request.output_dir.string());

  ensure_output_dir(request.output_dir);

  const std::vector<std::string> args{request.project_root.string(), request.output_dir.string()};
  const ToolsConfig & tools = config_.tools;

  const ToolOutcome injection =
    run_tool("Injecting __future__ imports", tools.resolve(tools.injector), args);
  report.add_step("future_injection", injection.status);
  save_payload(report, injection, k_injection_report);

  const ToolOutcome lint =
    run_tool("Capturing lint baseline", tools.resolve(tools.lint_baseline), args);
  report.add_step("lint_baseline", lint.status);
  save_payload(report, lint, k_lint_baseline);

  const ToolOutcome scaffolds =
    run_tool("Generating test scaffolds", tools.resolve(tools.test_scaffolds), args);
  report.add_step("test_scaffolds", scaffolds.status);
  save_payload(report, scaffolds, k_test_scaffolds);

  if (is_usable(injection.status)) {
    copy_counter(report.counters, injection, "files_modified", "files_with_future_imports");
  }
  if (is_usable(scaffolds.status)) {
    copy_counter(report.counters, scaffolds, "test_files_created", "test_files_created");
  }

  write_summary(report);

  if (printer_) {
    printer_->summary_header(Phase::Foundation);
    printer_->status_line("Future imports", injection.status);
    printer_->status_line("Lint baseline", lint.status);
    printer_->status_line("Test scaffolds", scaffolds.status);
    if (report.counters.contains("files_with_future_imports")) {
      printer_->field("Files modified", counter_text(report.counters, "files_with_future_imports"));
    }
    narrate_artifacts(report.artifacts);

    switch (report.status) {
      case PhaseStatus::Proceed:
        printer_->conclusion(report.status, "Phase 1 ready for Phase 2 (mechanical fixes)");
        break;
      case PhaseStatus::Caution:
        printer_->conclusion(
          report.status, "Phase 1 finished with skipped or timed-out steps. Review before Phase 2");
        break;
      case PhaseStatus::Blocked:
        printer_->conclusion(report.status, "Phase 1 blocked by tool errors. Fix before Phase 2");
        break;
    }
  }
  return report;
}

// ============================================================================
// Phase 2: Mechanical
// ============================================================================

PhaseReport Orchestrator::run_mechanical(const PhaseRequest & request)
{
  PhaseReport report;
  report.phase = Phase::Mechanical;
  report.project_root = request.project_root;
  report.output_dir = request.output_dir;

  const fs::path raw_scan = request.raw_scan.value_or(fs::path(k_default_raw_scan));

  if (printer_) {
    printer_->banner(Phase::Mechanical, "Apply automated fixes");
    printer_->field("Project root", request.project_root.string());
    printer_->field("Raw scan", raw_scan.string());
    printer_->field("Output dir", request.output_dir.string());
  }
  spdlog::info("phase mechanical: root={} scan={} output={}", request.project_root.string(),
               raw_scan.string(), request.output_dir.string());

  ensure_output_dir(request.output_dir);
  const ToolsConfig & tools = config_.tools;
  const TierLabels & labels = config_.tiers.labels;

  // Step 1: work items
  const ToolOutcome generation = run_tool(
    "Generating work items", tools.resolve(tools.work_item_generator),
    {raw_scan.string(), request.output_dir.string()});
  report.add_step("work_items_generation", generation.status);
  save_payload(report, generation, k_work_items);

  std::vector<WorkItem> items;
  if (is_usable(generation.status)) {
    if (const nlohmann::json * payload = generation.structured_object()) {
      items = work_items_from_document(*payload, labels);
    }
  }

  // Step 2: one fixer invocation per automated item
  const fs::path fixer = tools.resolve(tools.fixer);
  size_t fixed = 0;
  size_t errors = 0;
  for (const auto & item : items) {
    if (!labels.is_automated_label(item.tier_label)) continue;

    const ToolOutcome fix = run_tool(
      fmt::format("Applying automated fix to {}", item.file), fixer,
      {item.id, item.file, request.output_dir.string()});
    if (is_usable(fix.status)) {
      ++fixed;
    } else {
      ++errors;
      spdlog::warn("automated fix for {} ({}) ended with {}", item.id, item.file,
                   to_string(fix.status));
    }
  }
  const ToolStatus fixes_status = errors == 0 ? ToolStatus::Complete : ToolStatus::Partial;
  report.add_step("automated_fixes", fixes_status);

  // Step 3: library replacement
  const ToolOutcome replacement = run_tool(
    "Replacing deprecated library imports", tools.resolve(tools.library_replacement),
    {request.project_root.string(), request.output_dir.string()});
  report.add_step("library_replacement", replacement.status);
  save_payload(report, replacement, k_library_replacement_report);

  report.counters["work_items_processed"] = items.size();
  report.counters["automated_tier_fixed"] = fixed;
  report.counters["automated_tier_errors"] = errors;
  copy_counter(report.counters, generation, "total_items", "total_work_items");
  copy_counter(report.counters, generation, "haiku_count", "automated_tier_items");

  write_summary(report);

  if (printer_) {
    printer_->summary_header(Phase::Mechanical);
    printer_->status_line("Work items generated", generation.status);
    printer_->field("Automated fixes applied", std::to_string(fixed));
    if (errors > 0) {
      printer_->field("Automated fix errors", std::to_string(errors));
    }
    printer_->status_line("Library replacement", replacement.status);
    if (report.counters.contains("total_work_items")) {
      printer_->field("Total work items", counter_text(report.counters, "total_work_items"));
    }
    narrate_artifacts(report.artifacts);

    if (errors == 0) {
      printer_->conclusion(
        report.status,
        "All automated-tier work items completed. Ready for Phase 3 (semantic review)");
    } else {
      printer_->conclusion(
        report.status, "Some automated fixes failed. Review errors before proceeding");
    }
  }
  return report;
}

// ============================================================================
// Phase 3: Semantic-Prep
// ============================================================================

SemanticPrepResult Orchestrator::run_semantic_prep(const SemanticRequest & request)
{
  const fs::path work_items_path =
    request.work_items.value_or(request.output_dir / k_work_items);
  const fs::path raw_scan = request.raw_scan.value_or(fs::path(k_default_raw_scan));

  if (printer_) {
    printer_->banner(Phase::SemanticPrep, "Prepare review brief");
    printer_->field("Work items", work_items_path.string());
    printer_->field("Raw scan", raw_scan.string());
    printer_->field("Output dir", request.output_dir.string());
  }
  spdlog::info("phase semantic: work_items={} output={}", work_items_path.string(),
               request.output_dir.string());

  ensure_output_dir(request.output_dir);

  SemanticPrepResult result;

  WorkItemLoadResult loaded = load_work_items(work_items_path, config_.tiers.labels);
  result.work_items_found = loaded.found;
  if (loaded.warning) {
    spdlog::warn("{}", *loaded.warning);
    if (printer_) printer_->warning(*loaded.warning);
  } else if (printer_) {
    printer_->field("Loaded work items", std::to_string(loaded.items.size()));
  }

  // The scan is only consulted for its pattern count.
  std::error_code ec;
  if (fs::exists(raw_scan, ec)) {
    std::string error;
    if (const auto scan = read_json_file(raw_scan, &error)) {
      if (const auto it = scan->find("patterns"); scan->is_object() && it != scan->end()) {
        result.scan_patterns = it->size();
      }
    } else {
      spdlog::warn("could not load raw scan: {}", error);
      if (printer_) printer_->warning("could not load raw scan: " + error);
    }
  }

  ClassifierOptions options;
  options.sample_cap = config_.tiers.sample_cap;
  options.first_weight = config_.tiers.first_weight;
  options.second_weight = config_.tiers.second_weight;
  result.brief = classify(loaded.items, options);

  result.brief_path = request.output_dir / k_review_brief;
  write_report(result.brief_path, to_json(result.brief));
  spdlog::info(
    "phase semantic: {} items, {} first tier, {} second tier", result.brief.total_items,
    result.brief.first.count, result.brief.second.count);

  if (printer_) {
    printer_->summary_header(Phase::SemanticPrep);
    printer_->field("Total work items", std::to_string(result.brief.total_items));
    printer_->field("First-tier items", std::to_string(result.brief.first.count));
    printer_->field("Second-tier items", std::to_string(result.brief.second.count));
    printer_->field("Automated items", std::to_string(result.brief.automated_count));
    printer_->field("Estimated tokens", std::to_string(result.brief.estimated_tokens));
    printer_->conclusion(
      result.status, "Phase 3 brief prepared. Next: hand the brief to the reasoning tiers");
  }
  return result;
}

}  // namespace tierflow
