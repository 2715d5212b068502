// tierflow - Tiered migration pipeline command line interface
//
// Usage:
//   tierflow foundation <project_root> [-s raw-scan] [-o out] [-c config]
//   tierflow mechanical <project_root> [-s raw-scan] [-o out] [-c config]
//   tierflow semantic [-w work-items] [-s raw-scan] [-o out] [-c config]
//   tierflow parse <file> [language] [--output file] [-c config]
//
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "tierflow/basic/logging.hpp"
#include "tierflow/pipeline/orchestrator.hpp"
#include "tierflow/pipeline/phase_printer.hpp"
#include "tierflow/pipeline/report_io.hpp"
#include "tierflow/project/pipeline_config.hpp"
#include "tierflow/syntax/grammar_resolver.hpp"
#include "tierflow/syntax/language_detect.hpp"
#include "tierflow/syntax/tree_builder.hpp"
#include "tierflow/syntax/tree_json.hpp"
#include "tierflow/tooling/tool_invoker.hpp"

namespace fs = std::filesystem;

namespace
{

// Exit codes for failures before a command produces a result.
constexpr int k_phase_usage_error = 2;
constexpr int k_parse_failure = 1;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "tierflow - tiered source migration pipeline\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  foundation <project_root>   Phase 1: prepare the codebase\n"
            << "  mechanical <project_root>   Phase 2: generate work items, apply automated fixes\n"
            << "  semantic                    Phase 3: prepare the review brief\n"
            << "  parse <file> [language]     Parse a file and print its syntax tree as JSON\n\n"
            << "Options:\n"
            << "  -s, --raw-scan <path>       Raw scan from the discovery phase\n"
            << "  -w, --work-items <path>     Work items (default: <output>/work-items.json)\n"
            << "  -o, --output <path>         Output directory (parse: output file)\n"
            << "  -c, --config <path>         Pipeline configuration (tierflow.yaml)\n"
            << "  -v, --verbose               Verbose output\n"
            << "  -h, --help                  Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::optional<std::string> raw_scan;
  std::optional<std::string> work_items;
  std::optional<std::string> output_path;
  std::optional<std::string> config_path;
  std::string error;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  const auto take_value = [&](int & i, const std::string & flag) -> std::optional<std::string> {
    if (i + 1 < argc) {
      return std::string(argv[++i]);
    }
    args.error = "option " + flag + " requires a value";
    return std::nullopt;
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-s" || arg == "--raw-scan") {
      args.raw_scan = take_value(i, arg);
    } else if (arg == "-w" || arg == "--work-items") {
      args.work_items = take_value(i, arg);
    } else if (arg == "-o" || arg == "--output") {
      args.output_path = take_value(i, arg);
    } else if (arg == "-c" || arg == "--config") {
      args.config_path = take_value(i, arg);
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else {
      args.positional.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/// Explicit -c, else tierflow.yaml above `search_from`, else defaults.
std::optional<tierflow::PipelineConfig> resolve_config(
  const CommandArgs & args, const fs::path & search_from)
{
  std::optional<fs::path> config_path;
  if (args.config_path) {
    config_path = fs::path(*args.config_path);
  } else {
    config_path = tierflow::find_pipeline_config(search_from);
  }

  if (!config_path) {
    spdlog::info("no {} found; using defaults", tierflow::k_pipeline_config_file_name);
    return tierflow::default_pipeline_config(fs::current_path());
  }

  auto result = tierflow::load_pipeline_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return std::nullopt;
  }
  spdlog::info("using configuration {}", config_path->string());
  return std::move(result.config);
}

tierflow::ToolInvoker make_invoker(
  const tierflow::PipelineConfig & config, const fs::path & log_dir)
{
  tierflow::ToolInvokerOptions options;
  options.interpreter = config.tools.interpreter;
  options.default_timeout = config.tools.timeout;
  return tierflow::ToolInvoker(options, tierflow::InvocationLog(log_dir));
}

// ============================================================================
// Commands
// ============================================================================

int cmd_phase(const CommandArgs & args, tierflow::Phase phase, const fs::path & log_dir)
{
  if (args.positional.empty()) {
    std::cerr << "error: project root required\n";
    std::cerr << "usage: tierflow " << args.command << " <project_root> [-s raw-scan] [-o out]\n";
    return k_phase_usage_error;
  }

  const fs::path project_root = args.positional.front();
  auto config = resolve_config(args, project_root);
  if (!config) {
    return k_phase_usage_error;
  }

  tierflow::PhaseRequest request;
  request.project_root = project_root;
  if (args.raw_scan) request.raw_scan = fs::path(*args.raw_scan);
  if (args.output_path) request.output_dir = *args.output_path;

  tierflow::ToolInvoker invoker = make_invoker(*config, log_dir);
  tierflow::PhasePrinter printer(std::cerr, tierflow::stderr_is_terminal());
  tierflow::Orchestrator orchestrator(std::move(*config), invoker, &printer);

  const tierflow::PhaseReport report = phase == tierflow::Phase::Foundation
                                         ? orchestrator.run_foundation(request)
                                         : orchestrator.run_mechanical(request);

  std::cout << tierflow::to_json(report).dump(2) << "\n";
  return tierflow::exit_code(report.status);
}

int cmd_semantic(const CommandArgs & args, const fs::path & log_dir)
{
  auto config = resolve_config(args, fs::current_path());
  if (!config) {
    return k_phase_usage_error;
  }

  tierflow::SemanticRequest request;
  if (args.work_items) request.work_items = fs::path(*args.work_items);
  if (args.raw_scan) request.raw_scan = fs::path(*args.raw_scan);
  if (args.output_path) request.output_dir = *args.output_path;

  tierflow::ToolInvoker invoker = make_invoker(*config, log_dir);
  tierflow::PhasePrinter printer(std::cerr, tierflow::stderr_is_terminal());
  tierflow::Orchestrator orchestrator(std::move(*config), invoker, &printer);

  const tierflow::SemanticPrepResult result = orchestrator.run_semantic_prep(request);

  std::cout << result.summary().dump(2) << "\n";
  return tierflow::exit_code(result.status);
}

int cmd_parse(const CommandArgs & args)
{
  if (args.positional.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: tierflow parse <file> [language] [--output file]\n";
    return k_parse_failure;
  }

  const fs::path input_path = fs::absolute(args.positional[0]);
  auto config = resolve_config(args, input_path.parent_path());
  if (!config) {
    return k_parse_failure;
  }

  std::string language;
  if (args.positional.size() > 1) {
    language = args.positional[1];
  } else if (auto detected = tierflow::detect_language(input_path)) {
    language = *detected;
  } else {
    std::cerr << "error: cannot detect the language of " << input_path.string()
              << "; pass it explicitly\n";
    return k_parse_failure;
  }

  auto resolver = tierflow::GrammarResolver::with_default_providers(config->grammars.search_paths);

  tierflow::ParseResult result;
  try {
    result = tierflow::parse_file(resolver, input_path, language);
  } catch (const tierflow::ParseRequestError & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_parse_failure;
  }

  const nlohmann::json document = tierflow::to_json(result);
  if (args.output_path) {
    tierflow::write_report(*args.output_path, document);
    std::cerr << "Wrote " << *args.output_path << "\n";
  } else {
    std::cout << document.dump(2) << "\n";
  }

  if (!result.success) {
    std::cerr << input_path.string() << ": " << result.error_nodes.size() << " syntax error(s)"
              << (result.error ? ": " + *result.error : std::string()) << "\n";
    return k_parse_failure;
  }
  return 0;
}

int dispatch(const CommandArgs & args, const fs::path & log_dir)
{
  if (args.command == "foundation") {
    return cmd_phase(args, tierflow::Phase::Foundation, log_dir);
  }

  if (args.command == "mechanical") {
    return cmd_phase(args, tierflow::Phase::Mechanical, log_dir);
  }

  if (args.command == "semantic") {
    return cmd_semantic(args, log_dir);
  }

  if (args.command == "parse") {
    return cmd_parse(args);
  }

  return -1;
}

std::string join_args(int argc, char * argv[])
{
  std::string out;
  for (int i = 1; i < argc; ++i) {
    if (!out.empty()) out += ' ';
    out += argv[i];
  }
  return out;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  const int usage_error = args.command == "parse" ? k_parse_failure : k_phase_usage_error;
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return usage_error;
  }

  tierflow::LoggingOptions logging;
  logging.verbose = args.verbose;
  const fs::path log_dir = tierflow::init_logging(logging);

  const auto started = std::chrono::steady_clock::now();
  std::error_code ec;
  spdlog::info("START tierflow {} (cwd={})", join_args(argc, argv), fs::current_path(ec).string());

  int exit_code = 0;
  try {
    exit_code = dispatch(args, log_dir);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    spdlog::error("{} failed: {}", args.command, e.what());
    exit_code = usage_error;
  }

  if (exit_code < 0) {
    std::cerr << "error: unknown command '" << args.command << "'\n";
    print_usage(argv[0]);
    exit_code = usage_error;
  }

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
  spdlog::info(
    "END tierflow {} exit={} duration={:.2f}s", args.command, exit_code, elapsed.count());
  spdlog::shutdown();
  return exit_code;
}
