// bsl_gradual/basic/diagnostic_printer.hpp
//
// Prints diagnostics with line/column information and, when the source text
// is available, the offending line with a position marker.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "bsl_gradual/basic/diagnostic.hpp"
#include "bsl_gradual/basic/source_file.hpp"

namespace bsl_gradual
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[BSL001]: variable 'Итог' is used before it is declared
 *     --> Module.bsl:5:13
 *      |
 *    5 |     Сумма = Итог + 1;
 *      |             ^ not declared in this scope
 *      |
 *      = help: declare 'Итог' with Перем or assign it first
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print one diagnostic. `source` may be null; then no snippet is shown.
  void print(const Diagnostic & diag, const SourceFile * source = nullptr);

  /// Print all diagnostics ordered by position, followed by a summary line.
  void print_all(const DiagnosticBag & diags, const SourceFile * source = nullptr);

  void print_summary(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label, const SourceFile * source);
  void print_source_line(
    std::string_view line, uint32_t line_num, uint32_t column, LabelStyle style,
    std::string_view label_message);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace bsl_gradual
