// tests/unit/driver/test_checker_config.cpp - Unit tests for bsl-types.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "bsl_gradual/driver/checker_config.hpp"

using namespace bsl_gradual;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

TEST(DriverCheckerConfig, EmptyTextGivesDefaults)
{
  const auto result = parse_checker_config("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.union_limits.max_members, 5U);
  EXPECT_DOUBLE_EQ(result.config.confidence_threshold, 0.7);
  EXPECT_TRUE(result.config.diagnostics.unknown_functions);
  EXPECT_EQ(result.config.file, "<module>");
}

TEST(DriverCheckerConfig, ParsesAllSections)
{
  const auto result = parse_checker_config(R"(
union:
  max_members: 3
  min_weight: 0.05
  confidence_cap: 0.8
diagnostics:
  unknown_functions: false
  operand_mismatch: false
confidence_threshold: 0.5
file: ОбщийМодуль.bsl
)");
  ASSERT_TRUE(result.success) << result.error;

  const CheckerConfig & config = result.config;
  EXPECT_EQ(config.union_limits.max_members, 3U);
  EXPECT_DOUBLE_EQ(config.union_limits.min_weight, 0.05);
  EXPECT_DOUBLE_EQ(config.union_limits.confidence_cap, 0.8);
  EXPECT_FALSE(config.diagnostics.unknown_functions);
  EXPECT_FALSE(config.diagnostics.operand_mismatch);
  EXPECT_TRUE(config.diagnostics.undeclared_variables);
  EXPECT_EQ(config.file, "ОбщийМодуль.bsl");

  const CheckerOptions options = config.to_options();
  EXPECT_FALSE(options.report_unknown_functions);
  EXPECT_FALSE(options.report_operand_mismatch);
  EXPECT_TRUE(options.report_reassignment);
  EXPECT_DOUBLE_EQ(options.confidence_threshold, 0.5);
  EXPECT_EQ(options.union_limits.max_members, 3U);
}

TEST(DriverCheckerConfig, RejectsOutOfRangeValues)
{
  EXPECT_FALSE(parse_checker_config("union:\n  max_members: 0\n").success);
  EXPECT_FALSE(parse_checker_config("union:\n  min_weight: 1.5\n").success);
  EXPECT_FALSE(parse_checker_config("union:\n  confidence_cap: -0.1\n").success);

  const auto result = parse_checker_config("confidence_threshold: 2\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("confidence_threshold"), std::string::npos);
}

TEST(DriverCheckerConfig, RejectsNonFiniteValues)
{
  EXPECT_FALSE(parse_checker_config("union:\n  min_weight: .nan\n").success);
  EXPECT_FALSE(parse_checker_config("union:\n  confidence_cap: .nan\n").success);
  EXPECT_FALSE(parse_checker_config("union:\n  confidence_cap: .inf\n").success);

  const auto result = parse_checker_config("confidence_threshold: .nan\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("confidence_threshold"), std::string::npos);
}

TEST(DriverCheckerConfig, RejectsWrongShapes)
{
  EXPECT_FALSE(parse_checker_config("- a\n- b\n").success);
  EXPECT_FALSE(parse_checker_config("union: 3\n").success);
  EXPECT_FALSE(parse_checker_config("diagnostics:\n  reassignment: maybe\n").success);
  EXPECT_FALSE(parse_checker_config("union: [unclosed\n").success);
}

TEST(DriverCheckerConfig, MissingFileGivesDefaults)
{
  const auto result =
    load_checker_config(std::filesystem::temp_directory_path() / "bsl_no_such_dir" / "x.yaml");
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.config.union_limits.max_members, 5U);
}

TEST(DriverCheckerConfig, FindsConfigInParentDirectory)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "bsl_config_test");
  const std::filesystem::path nested = temp_dir.path / "src" / "CommonModules";
  std::filesystem::create_directories(nested);

  const std::filesystem::path config_file = temp_dir.path / k_checker_config_file_name;
  {
    std::ofstream f(config_file);
    f << "union:\n  max_members: 2\n";
  }

  const auto found = find_checker_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(std::filesystem::canonical(*found), std::filesystem::canonical(config_file));

  const auto result = load_checker_config(*found);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.union_limits.max_members, 2U);
}
