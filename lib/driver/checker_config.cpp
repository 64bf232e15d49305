// bsl_gradual/driver/checker_config.cpp - Checker configuration implementation
//
#include "bsl_gradual/driver/checker_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <string>
#include <utility>

namespace bsl_gradual
{

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root)
{
  CheckerConfig config = default_config();
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // 'union' section
  if (const YAML::Node u = root["union"]) {
    if (!u.IsMap()) return ConfigLoadResult::fail("union must be a map");

    if (u["max_members"]) {
      const int max_members = u["max_members"].as<int>();
      if (max_members < 1) {
        return ConfigLoadResult::fail("union.max_members must be at least 1");
      }
      config.union_limits.max_members = static_cast<size_t>(max_members);
    }
    if (u["min_weight"]) {
      config.union_limits.min_weight = u["min_weight"].as<double>();
      if (
        !std::isfinite(config.union_limits.min_weight) || config.union_limits.min_weight < 0.0 ||
        config.union_limits.min_weight >= 1.0) {
        return ConfigLoadResult::fail("union.min_weight must be in [0, 1)");
      }
    }
    if (u["confidence_cap"]) {
      config.union_limits.confidence_cap = u["confidence_cap"].as<double>();
      if (
        !std::isfinite(config.union_limits.confidence_cap) ||
        config.union_limits.confidence_cap < 0.0 || config.union_limits.confidence_cap > 1.0) {
        return ConfigLoadResult::fail("union.confidence_cap must be in [0, 1]");
      }
    }
  }

  // 'diagnostics' section
  if (const YAML::Node d = root["diagnostics"]) {
    if (!d.IsMap()) return ConfigLoadResult::fail("diagnostics must be a map");

    auto flag = [&d](const char * key, bool & out) {
      if (d[key]) out = d[key].as<bool>();
    };
    flag("undeclared_variables", config.diagnostics.undeclared_variables);
    flag("unknown_functions", config.diagnostics.unknown_functions);
    flag("reassignment", config.diagnostics.reassignment);
    flag("operand_mismatch", config.diagnostics.operand_mismatch);
  }

  if (root["confidence_threshold"]) {
    config.confidence_threshold = root["confidence_threshold"].as<double>();
    if (
      !std::isfinite(config.confidence_threshold) || config.confidence_threshold < 0.0 ||
      config.confidence_threshold > 1.0) {
      return ConfigLoadResult::fail("confidence_threshold must be in [0, 1]");
    }
  }

  if (root["file"]) {
    config.file = root["file"].as<std::string>();
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

CheckerOptions CheckerConfig::to_options() const
{
  CheckerOptions options;
  options.union_limits = union_limits;
  options.confidence_threshold = confidence_threshold;
  options.report_undeclared_variables = diagnostics.undeclared_variables;
  options.report_unknown_functions = diagnostics.unknown_functions;
  options.report_reassignment = diagnostics.reassignment;
  options.report_operand_mismatch = diagnostics.operand_mismatch;
  return options;
}

CheckerConfig default_config() { return CheckerConfig{}; }

ConfigLoadResult load_checker_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::ok(default_config());
  }

  try {
    return parse_root(YAML::LoadFile(config_path.string()));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail(
      "failed to parse " + config_path.string() + ": " + std::string(e.what()));
  }
}

ConfigLoadResult parse_checker_config(std::string_view yaml_text)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_checker_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_checker_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace bsl_gradual
