// bsl_gradual/driver/checker_config.hpp - Checker configuration (bsl-types.yaml)
//
// Shared by the CLI and by embedders. A missing file is not an error: the
// defaults reproduce the checker's built-in behavior.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "bsl_gradual/sema/type_checker.hpp"

namespace bsl_gradual
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Which diagnostic families are reported.
 */
struct DiagnosticsConfig
{
  bool undeclared_variables = true;
  bool unknown_functions = true;
  bool reassignment = true;
  bool operand_mismatch = true;
};

/**
 * Complete checker configuration (bsl-types.yaml).
 */
struct CheckerConfig
{
  UnionLimits union_limits;
  DiagnosticsConfig diagnostics;
  double confidence_threshold = 0.7;

  /// File name reported in diagnostics when the tree does not name one.
  std::string file = "<module>";

  /// CheckerOptions equivalent of this configuration.
  [[nodiscard]] CheckerOptions to_options() const;
};

[[nodiscard]] CheckerConfig default_config();

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  CheckerConfig config;

  bool success = false;
  std::string error;

  static ConfigLoadResult ok(CheckerConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a configuration file. A path that does not exist yields the defaults.
 *
 * @param config_path Path to bsl-types.yaml
 */
[[nodiscard]] ConfigLoadResult load_checker_config(const std::filesystem::path & config_path);

/// Parse configuration text (same rules as load_checker_config()).
[[nodiscard]] ConfigLoadResult parse_checker_config(std::string_view yaml_text);

/**
 * Search for bsl-types.yaml from `start_dir` up to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_checker_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_checker_config_file_name = "bsl-types.yaml";

}  // namespace bsl_gradual
