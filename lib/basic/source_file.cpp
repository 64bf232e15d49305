// bsl_gradual/basic/source_file.cpp
#include "bsl_gradual/basic/source_file.hpp"

#include <utility>

namespace bsl_gradual
{

SourceFile::SourceFile(std::string path, std::string text)
: path_(std::move(path)), text_(std::move(text))
{
  line_starts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n' && i + 1 < text_.size()) {
      line_starts_.push_back(i + 1);
    }
  }
  if (text_.empty()) {
    line_starts_.clear();
  }
}

std::string_view SourceFile::get_line(uint32_t line) const noexcept
{
  if (line == 0 || line > line_starts_.size()) {
    return {};
  }
  const size_t start = line_starts_[line - 1];
  size_t end = (line < line_starts_.size()) ? line_starts_[line] : text_.size();
  const std::string_view view(text_);
  while (end > start && (view[end - 1] == '\n' || view[end - 1] == '\r')) {
    --end;
  }
  return view.substr(start, end - start);
}

}  // namespace bsl_gradual
