/***
 * Name: spindle::exceptions::UnknownFunctionError
 * Purpose: Exception for a call to a function name the library does not contain.
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

class UnknownFunctionError : public SpindleException {
 public:
  explicit UnknownFunctionError(std::string msg) noexcept : SpindleException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace spindle
