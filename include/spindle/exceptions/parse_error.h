/***
 * Name: spindle::exceptions::ParseError
 * Purpose: Exception for a script line the parser cannot read; reported as a diagnostic.
 * Inputs: Error message and the 1-based column it refers to (0 when unknown)
 * Outputs: Exception object
 * Theory of Operation: Deriving from SpindleException; the parser catches it at
 *   the offending line and records a Diagnostic at that line and column.
 */
#pragma once

#include "spindle/exceptions/spindle_exception.h"

#include <string>
#include <utility>

namespace spindle {
namespace exceptions {

class ParseError : public SpindleException {
 public:
  explicit ParseError(std::string msg, int col = 0) noexcept : SpindleException(std::move(msg)), col_(col) {}

  int col() const noexcept { return col_; }

 private:
  int col_;
};

}  // namespace exceptions
}  // namespace spindle
