/***
 * Name: spindle::exceptions::ProgramConflictError
 * Purpose: Exception for combining programs that define the same node name.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from SpindleException.
 */
#pragma once

#include "spindle/exceptions/spindle_exception.h"

#include <string>
#include <utility>

namespace spindle {
namespace exceptions {

class ProgramConflictError : public SpindleException {
 public:
  explicit ProgramConflictError(std::string msg) noexcept : SpindleException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace spindle
