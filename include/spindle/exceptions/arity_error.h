/***
 * Name: spindle::exceptions::ArityError
 * Purpose: Exception for a library call whose argument count differs from the function's arity.
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

class ArityError : public SpindleException {
 public:
  explicit ArityError(std::string msg) noexcept : SpindleException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace spindle
