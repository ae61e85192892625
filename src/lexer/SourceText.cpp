/***
 * Name: spindle::lex::SourceText (impl)
 * Purpose: Split script text into lines.
 */
#include "lexer/SourceText.h"

#include <sstream>
#include <utility>

namespace spindle::lex {

SourceText::SourceText(const std::string& text, std::string name) : name_(std::move(name)) {
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    lines_.push_back(std::move(line));
  }
}

std::optional<std::string> SourceText::lineAt(const int number) const {
  if (number < 1 || static_cast<std::size_t>(number) > lines_.size()) { return std::nullopt; }
  return lines_[static_cast<std::size_t>(number - 1)];
}

} // namespace spindle::lex
