// bsl-typecheck - gradual type checker for BSL modules
//
// Usage:
//   bsl-typecheck <ast.json> [--config bsl-types.yaml] [--signatures sigs.json]
//                 [--source Module.bsl] [--dump-context out.json] [--no-color] [-v]
//
// The input is the syntax tree emitted by the external parser as JSON.
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/core.h>

#include "bsl_gradual/ast/ast_context.hpp"
#include "bsl_gradual/ast/ast_json.hpp"
#include "bsl_gradual/basic/diagnostic_printer.hpp"
#include "bsl_gradual/basic/source_file.hpp"
#include "bsl_gradual/driver/checker_config.hpp"
#include "bsl_gradual/driver/type_json.hpp"
#include "bsl_gradual/sema/type_checker.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_type_errors = 1;
constexpr int k_exit_failure = 2;

void print_usage(const char * program_name)
{
  std::cerr << "BSL gradual type checker v0.1.0\n\n"
            << "Usage: " << program_name << " <ast.json> [options]\n\n"
            << "Options:\n"
            << "  --config <path>          Checker configuration (default: nearest "
            << bsl_gradual::k_checker_config_file_name << ")\n"
            << "  --signatures <path>      Signatures of functions from other modules\n"
            << "  --source <path>          Module source, for code snippets in diagnostics\n"
            << "  --dump-context <path>    Write variable/function types and diagnostics as JSON\n"
            << "  --no-color               Disable colored output\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string input_file;
  std::string config_path;
  std::string signatures_path;
  std::string source_path;
  std::string dump_path;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  auto take_value = [&](int & i, std::string & out, const std::string & flag) {
    if (i + 1 < argc) {
      out = argv[++i];
    } else {
      args.error = "missing value for " + flag;
    }
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config") {
      take_value(i, args.config_path, arg);
    } else if (arg == "--signatures") {
      take_value(i, args.signatures_path, arg);
    } else if (arg == "--source") {
      take_value(i, args.source_path, arg);
    } else if (arg == "--dump-context") {
      take_value(i, args.dump_path, arg);
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      args.error = "unexpected argument: " + arg;
    }
  }

  if (args.error.empty() && !args.show_help && args.input_file.empty()) {
    args.error = "input file required";
  }
  return args;
}

// ============================================================================
// Steps
// ============================================================================

std::optional<bsl_gradual::CheckerConfig> load_config(const CommandArgs & args)
{
  std::optional<fs::path> path;
  if (!args.config_path.empty()) {
    path = fs::path(args.config_path);
    if (!fs::exists(*path)) {
      std::cerr << "error: config file not found: " << path->string() << "\n";
      return std::nullopt;
    }
  } else {
    path = bsl_gradual::find_checker_config(fs::absolute(args.input_file).parent_path());
  }

  if (!path) return bsl_gradual::default_config();

  const auto result = bsl_gradual::load_checker_config(*path);
  if (!result.success) {
    std::cerr << "error: " << path->string() << ": " << result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    fmt::print(stderr, "Using configuration: {}\n", path->string());
  }
  return result.config;
}

std::optional<bsl_gradual::SourceFile> load_source(const std::string & path)
{
  std::ifstream in(path);
  if (!in.is_open()) {
    std::cerr << "error: failed to open file: " << path << "\n";
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return bsl_gradual::SourceFile(path, buffer.str());
}

bool write_dump(const std::string & path, const bsl_gradual::CheckResult & result)
{
  std::ofstream out(path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << path << "\n";
    return false;
  }
  out << bsl_gradual::to_json(result).dump(2) << "\n";
  return true;
}

void print_statistics(const bsl_gradual::CheckResult & result)
{
  const auto & s = result.stats;
  fmt::print(
    stderr, "Dependency graph: {} nodes, {} edges\n", s.dependency_nodes, s.dependency_edges);
  fmt::print(stderr, "Functions analyzed: {}\n", s.functions_analyzed);
  fmt::print(stderr, "Flow states: {}, merge points: {}\n", s.flow_states, s.merge_points);
  fmt::print(
    stderr, "Variables: {}, functions: {}\n", result.context.variables.size(),
    result.context.functions.size());
}

int run(const CommandArgs & args)
{
  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return k_exit_failure;
  }

  const auto config = load_config(args);
  if (!config) return k_exit_failure;

  bsl_gradual::AstContext ast;
  const auto loaded = bsl_gradual::load_program_json_file(input_path, ast);
  if (!loaded.success) {
    std::cerr << "error: " << input_path.string() << ": " << loaded.error << "\n";
    return k_exit_failure;
  }

  std::string file = std::string(loaded.program->file);
  if (file.empty()) file = args.source_path.empty() ? config->file : args.source_path;

  bsl_gradual::TypeChecker checker(file, config->to_options());

  if (!args.signatures_path.empty()) {
    auto sigs = bsl_gradual::load_signatures_file(args.signatures_path);
    if (!sigs.success) {
      std::cerr << "error: " << args.signatures_path << ": " << sigs.error << "\n";
      return k_exit_failure;
    }
    if (args.verbose) {
      fmt::print(stderr, "Loaded {} external signatures\n", sigs.signatures.size());
    }
    for (auto & [name, sig] : sigs.signatures) {
      checker.add_external_signature(name, std::move(sig));
    }
  }

  std::optional<bsl_gradual::SourceFile> source;
  if (!args.source_path.empty()) {
    source = load_source(args.source_path);
    if (!source) return k_exit_failure;
  }

  if (args.verbose) {
    fmt::print(stderr, "Checking: {}\n", file);
  }

  const bsl_gradual::CheckResult result = checker.check(*loaded.program);

  if (args.verbose) print_statistics(result);

  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  bsl_gradual::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(result.diagnostics, source ? &*source : nullptr);

  if (!args.dump_path.empty() && !write_dump(args.dump_path, result)) {
    return k_exit_failure;
  }

  return result.diagnostics.has_errors() ? k_exit_type_errors : k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }
  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n\n";
    print_usage(argv[0]);
    return k_exit_failure;
  }

  try {
    return run(args);
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return k_exit_failure;
  }
}
