// bsl_gradual/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "bsl_gradual/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace bsl_gradual
{

namespace
{

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::reset;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile * source)
{
  print_severity_header(diag);

  std::string filename = diag.file;
  if (filename.empty()) {
    filename = source != nullptr && !source->path().empty() ? source->path() : "<unknown>";
  }
  const SourceRange primary = diag.primary_range();
  if (primary.is_valid()) {
    fmt::print(os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary.line(), primary.column());
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  if (source != nullptr) {
    fmt::print(os_, "{}\n", gutter_pipe());
    for (const auto & label : diag.labels) {
      print_label(label, source);
    }
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile * source)
{
  std::vector<Diagnostic> sorted(diags.begin(), diags.end());
  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic & a, const Diagnostic & b) {
    return a.primary_range().begin < b.primary_range().begin;
  });

  for (const auto & d : sorted) {
    print(d, source);
  }
  print_summary(diags);
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  size_t counts[4] = {0, 0, 0, 0};
  for (const auto & d : diags) {
    ++counts[static_cast<size_t>(d.severity)];
  }
  const std::string text = fmt::format(
    "{} error(s), {} warning(s), {} info, {} hint(s)", counts[0], counts[1], counts[2], counts[3]);
  if (use_color_) {
    os_ << rang::style::bold << (counts[0] > 0 ? rang::fg::red : rang::fg::green) << text
        << rang::fg::reset << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", text);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view severity = to_string(diag.severity);
  const std::string head =
    diag.code.empty() ? std::string(severity) : fmt::format("{}[{}]", severity, diag.code);

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", head, diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label, const SourceFile * source)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }
  const std::string_view line = source->get_line(label.range.line());
  if (line.empty()) {
    return;
  }
  print_source_line(line, label.range.line(), label.range.column(), label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  std::string_view line, uint32_t line_num, uint32_t column, LabelStyle style,
  std::string_view label_message)
{
  // Tabs are expanded to 4 columns for display.
  std::string cleaned;
  std::string marker_prefix;
  cleaned.reserve(line.size());
  uint32_t col = 1;
  for (const char c : line) {
    const bool before_marker = col < column;
    if (c == '\t') {
      cleaned += "    ";
      if (before_marker) marker_prefix += "    ";
    } else {
      cleaned += c;
      // Continuation bytes of a UTF-8 sequence do not advance the column.
      if ((static_cast<unsigned char>(c) & 0xC0U) == 0x80U) {
        continue;
      }
      if (before_marker) marker_prefix += ' ';
    }
    ++col;
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned);

  fmt::print(os_, "{} {}", gutter_pipe(), marker_prefix);
  const char marker = (style == LabelStyle::Primary) ? '^' : '-';
  if (use_color_) {
    os_ << (style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan) << rang::style::bold;
  }
  fmt::print(os_, "{}", marker);
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return "\033[1;36m  -->\033[0m";
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return "\033[1;36m      |\033[0m";
  }
  return "      |";
}

}  // namespace bsl_gradual
