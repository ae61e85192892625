/***
 * Name: spindle::lex::SourceText
 * Purpose: One named dialogue script split into physical lines.
 * Inputs:
 *   - Script text and the file name diagnostics should report
 * Outputs:
 *   - Lines without their terminators (LF or CRLF), addressable by 1-based number
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace spindle::lex {

class SourceText {
public:
    SourceText(const std::string& text, std::string name);

    const std::string& name() const { return name_; }
    const std::vector<std::string>& lines() const { return lines_; }

    // Line `number` (1-based), or nothing when out of range.
    std::optional<std::string> lineAt(int number) const;

private:
    std::string name_;
    std::vector<std::string> lines_{};
};

} // namespace spindle::lex
