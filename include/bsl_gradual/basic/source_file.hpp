// bsl_gradual/basic/source_file.hpp - Source positions and optional source text
//
// Positions come from the external parser as 1-based (line, column) pairs,
// so no offset-to-line translation is needed here. A SourceFile is only used
// to show source snippets under diagnostics when the text is available.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace bsl_gradual
{

/**
 * A 1-based line/column position. Line 0 means "no position".
 */
struct SourceLocation
{
  uint32_t line = 0;
  uint32_t column = 0;

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line != 0; }

  friend constexpr bool operator==(SourceLocation a, SourceLocation b) noexcept
  {
    return a.line == b.line && a.column == b.column;
  }
  friend constexpr bool operator!=(SourceLocation a, SourceLocation b) noexcept { return !(a == b); }
  friend constexpr bool operator<(SourceLocation a, SourceLocation b) noexcept
  {
    return a.line != b.line ? a.line < b.line : a.column < b.column;
  }
};

/**
 * Half-open range [begin, end). `end` may be invalid when only a start
 * position is known.
 */
struct SourceRange
{
  SourceLocation begin;
  SourceLocation end;

  constexpr SourceRange() = default;
  constexpr explicit SourceRange(SourceLocation b) : begin(b) {}
  constexpr SourceRange(SourceLocation b, SourceLocation e) : begin(b), end(e) {}

  [[nodiscard]] static constexpr SourceRange at(uint32_t line, uint32_t column) noexcept
  {
    return SourceRange(SourceLocation{line, column});
  }

  [[nodiscard]] constexpr bool is_valid() const noexcept { return begin.is_valid(); }
  [[nodiscard]] constexpr uint32_t line() const noexcept { return begin.line; }
  [[nodiscard]] constexpr uint32_t column() const noexcept { return begin.column; }
};

/**
 * Source text of one file, split into lines on load.
 */
class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(std::string path, std::string text);

  [[nodiscard]] const std::string & path() const noexcept { return path_; }
  [[nodiscard]] const std::string & text() const noexcept { return text_; }
  [[nodiscard]] size_t line_count() const noexcept { return line_starts_.size(); }

  /// Line by 1-based number, without the line terminator. Empty if out of range.
  [[nodiscard]] std::string_view get_line(uint32_t line) const noexcept;

private:
  std::string path_;
  std::string text_;
  std::vector<size_t> line_starts_;
};

}  // namespace bsl_gradual
