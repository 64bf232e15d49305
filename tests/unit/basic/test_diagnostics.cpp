// tests/unit/basic/test_diagnostics.cpp - Unit tests for DiagnosticBag and DiagnosticPrinter
//
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "bsl_gradual/basic/diagnostic.hpp"
#include "bsl_gradual/basic/diagnostic_printer.hpp"
#include "bsl_gradual/basic/source_file.hpp"

using namespace bsl_gradual;

TEST(BasicDiagnostics, BuilderCommitsOnDestruction)
{
  DiagnosticBag bag("Module.bsl");
  {
    auto builder = bag.report_warning(SourceRange::at(2, 5), "first", "here");
    builder.with_code("BSL001").with_help("fix it");
    EXPECT_TRUE(bag.empty());
  }
  bag.report_error(SourceRange::at(1, 1), "second").with_code("BSL002");

  ASSERT_EQ(bag.size(), 2U);
  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "BSL001");
  EXPECT_EQ(d.file, "Module.bsl");
  EXPECT_EQ(d.line(), 2U);
  EXPECT_EQ(d.column(), 5U);
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "fix it");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "here");
}

TEST(BasicDiagnostics, SeverityQueries)
{
  DiagnosticBag bag;
  bag.report_info(SourceRange::at(1, 1), "info");
  EXPECT_FALSE(bag.has_errors());
  EXPECT_FALSE(bag.has_warnings());

  bag.report_warning(SourceRange::at(1, 1), "warning");
  bag.report_error(SourceRange::at(1, 1), "error");
  bag.report_hint(SourceRange::at(1, 1), "hint");

  EXPECT_TRUE(bag.has_errors());
  EXPECT_TRUE(bag.has_warnings());
  EXPECT_EQ(bag.errors().size(), 1U);
  EXPECT_EQ(bag.warnings().size(), 1U);
  EXPECT_EQ(bag.with_severity(Severity::Hint).size(), 1U);

  DiagnosticBag other;
  other.report_error(SourceRange::at(3, 1), "more");
  bag.merge(other);
  EXPECT_EQ(bag.errors().size(), 2U);
}

TEST(BasicDiagnostics, SourceFileLines)
{
  const SourceFile source("Module.bsl", "Перем x;\r\nx = 1;\n");
  EXPECT_EQ(source.line_count(), 2U);
  EXPECT_EQ(source.get_line(1), "Перем x;");
  EXPECT_EQ(source.get_line(2), "x = 1;");
  EXPECT_EQ(source.get_line(3), "");
  EXPECT_EQ(source.get_line(0), "");
}

TEST(BasicDiagnostics, PrinterShowsSnippetAndSummary)
{
  DiagnosticBag bag("Module.bsl");
  bag.report_warning(
       SourceRange::at(2, 9), "variable 'Итог' is used before it is declared",
       "not declared in this scope")
    .with_code("BSL001");

  const SourceFile source("Module.bsl", "Сумма = 0;\nСумма = Итог + 1;\n");
  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, &source);

  const std::string text = out.str();
  EXPECT_NE(text.find("warning[BSL001]: variable 'Итог' is used before it is declared"),
            std::string::npos);
  EXPECT_NE(text.find("  --> Module.bsl:2:9"), std::string::npos);
  EXPECT_NE(text.find("    2 | Сумма = Итог + 1;"), std::string::npos);
  // Marker under column 9, counted in characters rather than bytes.
  EXPECT_NE(text.find("      |         ^ not declared in this scope"), std::string::npos);
  EXPECT_NE(text.find("0 error(s), 1 warning(s), 0 info, 0 hint(s)"), std::string::npos);
}

TEST(BasicDiagnostics, PrinterWithoutSource)
{
  DiagnosticBag bag("Module.bsl");
  bag.report_error(SourceRange::at(4, 2), "function 'Ф' expects 1 arguments, 0 provided")
    .with_help("pass the missing arguments");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(bag.all()[0]);

  const std::string text = out.str();
  EXPECT_EQ(text.find("error: function 'Ф'"), 0U);
  EXPECT_NE(text.find("  --> Module.bsl:4:2"), std::string::npos);
  EXPECT_NE(text.find("   = help: pass the missing arguments"), std::string::npos);
  EXPECT_EQ(text.find("    4 |"), std::string::npos);
}

TEST(BasicDiagnostics, PrinterShowsSecondaryLabel)
{
  DiagnosticBag bag("Module.bsl");
  bag.report_warning(SourceRange::at(2, 1), "incompatible assignment to variable 'x'")
    .with_code("BSL006")
    .with_secondary_label(SourceRange::at(1, 1), "previously assigned Число here");

  const SourceFile source("Module.bsl", "x = 1;\nx = \"a\";\n");
  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print(bag.all()[0], &source);

  const std::string text = out.str();
  EXPECT_EQ(bag.all()[0].primary_range().line(), 2U);
  EXPECT_NE(text.find("    1 | x = 1;"), std::string::npos);
  EXPECT_NE(text.find("      | - previously assigned Число here"), std::string::npos);
  EXPECT_NE(text.find("      | ^"), std::string::npos);
}
