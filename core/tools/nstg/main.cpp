// nstg - Negative space test generation command line interface
//
// Usage:
//   nstg analyze <signature.json> [--executions file] [--config file]
//                [-o out.json] [--strategy s] [--order o] [--report]
//                [--no-solver] [-v]
//   nstg universe <signature.json>
//
#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "nstg/basic/diagnostic_printer.hpp"
#include "nstg/driver/analyzer.hpp"
#include "nstg/project/project_config.hpp"
#include "nstg/serialization/json_io.hpp"
#include "nstg/space/type_universe.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "NSTG - Negative Space Test Generator v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  analyze <signature.json>  Find untested regions and generate test cases\n"
            << "  universe <signature.json> Print the input universe of a signature\n\n"
            << "Options:\n"
            << "  --executions <file>       Observed executions (JSON array)\n"
            << "  --config <file>           Configuration file (default: nearest nstg.yaml)\n"
            << "  -o, --output <file>       Write test cases to a file instead of stdout\n"
            << "  --strategy <name>         balanced | boundary-first | cardinality-first\n"
            << "  --order <name>            priority | boundary-first | error-first\n"
            << "  --report                  Emit the full analysis report instead of test cases\n"
            << "  --no-solver               Disable constraint solving\n"
            << "  -v, --verbose             Verbose output\n"
            << "  -h, --help                Show this help message\n";
}

void print_diagnostics(const nstg::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  nstg::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string executions_file;
  std::string config_file;
  std::string output_path;
  std::string strategy;
  std::string order;
  bool report = false;
  bool no_solver = false;
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

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--executions") {
      if (i + 1 < argc) {
        args.executions_file = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_file = argv[++i];
      }
    } else if (arg == "--strategy") {
      if (i + 1 < argc) {
        args.strategy = argv[++i];
      }
    } else if (arg == "--order") {
      if (i + 1 < argc) {
        args.order = argv[++i];
      }
    } else if (arg == "--report") {
      args.report = true;
    } else if (arg == "--no-solver") {
      args.no_solver = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Helpers
// ============================================================================

/// Explicit --config, else the nearest nstg.yaml, else defaults
std::optional<nstg::ProjectConfig> resolve_config(const CommandArgs & args)
{
  std::optional<fs::path> config_path;
  if (!args.config_file.empty()) {
    config_path = fs::path(args.config_file);
  } else {
    config_path = nstg::find_project_config(fs::current_path());
  }

  if (!config_path) {
    return nstg::ProjectConfig{};
  }

  const auto loaded = nstg::load_project_config(*config_path);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  return loaded.config;
}

std::optional<nstg::FunctionSignature> read_signature(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: signature file required\n";
    std::cerr << "usage: nstg " << args.command << " <signature.json>\n";
    return std::nullopt;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  auto loaded = nstg::load_signature(input_path);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error << "\n";
    return std::nullopt;
  }
  return std::move(loaded.signature);
}

bool write_output(const std::string & path, const std::string & text)
{
  if (path.empty()) {
    std::cout << text << "\n";
    return true;
  }

  std::ofstream out(path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << path << "\n";
    return false;
  }
  out << text << "\n";
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_analyze(const CommandArgs & args)
{
  auto config = resolve_config(args);
  if (!config) {
    return 1;
  }

  const auto signature = read_signature(args);
  if (!signature) {
    return 1;
  }

  nstg::AnalysisConfig analysis = config->analysis;
  if (!args.strategy.empty()) {
    const auto strategy = nstg::parse_strategy(args.strategy);
    if (!strategy) {
      std::cerr << "error: unknown strategy '" << args.strategy << "'\n";
      return 1;
    }
    analysis.strategy = *strategy;
  }
  if (args.no_solver) {
    analysis.smt_solver_enabled = false;
  }

  nstg::TestOrdering ordering = config->output.ordering;
  if (!args.order.empty()) {
    const auto parsed = nstg::parse_test_ordering(args.order);
    if (!parsed) {
      std::cerr << "error: unknown test order '" << args.order << "'\n";
      return 1;
    }
    ordering = *parsed;
  }

  std::vector<nstg::CoverageTracker::Observed> executions;
  if (!args.executions_file.empty()) {
    auto loaded = nstg::load_executions(args.executions_file);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return 1;
    }
    executions = std::move(loaded.executions);
  }

  if (args.verbose) {
    std::cerr << "Analyzing: " << signature->name << " (" << executions.size()
              << " recorded executions)\n";
  }

  nstg::Analyzer analyzer(analysis);
  if (args.verbose) {
    analyzer.set_progress_stream(&std::cerr);
  }

  nstg::AnalysisResult result = analyzer.analyze(*signature, std::move(executions));
  result.test_cases = nstg::TestGenerator::prioritize_tests(std::move(result.test_cases), ordering);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return 1;
  }

  std::string output_path = args.output_path;
  if (output_path.empty() && config->output.path) {
    output_path = (config->project_root / *config->output.path).string();
  }

  const std::string text =
    args.report ? nstg::to_json(result).dump(2) : nstg::to_json(result.test_cases).dump(2);
  if (!write_output(output_path, text)) {
    return 1;
  }

  if (!output_path.empty()) {
    std::cerr << "Generated " << result.test_cases.size() << " test cases: " << output_path
              << "\n";
  }
  return 0;
}

int cmd_universe(const CommandArgs & args)
{
  const auto signature = read_signature(args);
  if (!signature) {
    return 1;
  }

  nstg::DiagnosticBag diagnostics;
  const auto universe = nstg::TypeUniverse{}.calculate_signature_universe(*signature, &diagnostics);

  if (!diagnostics.empty()) {
    print_diagnostics(diagnostics);
  }

  for (const auto & region : universe) {
    std::cout << fmt::format(
      "{:<40} {:>12}  {}\n", region.id, region.cardinality.to_string(), region.description);
  }
  std::cout << fmt::format(
    "total: {} regions, cardinality {}\n", universe.size(),
    nstg::TypeUniverse::total_cardinality(universe).to_string());
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "analyze") {
    return cmd_analyze(args);
  }

  if (args.command == "universe") {
    return cmd_universe(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
