/***
 * Name: spindle::exceptions::ArgumentTypeError
 * Purpose: Exception for a library call argument that cannot convert to the parameter kind.
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

class ArgumentTypeError : public SpindleException {
 public:
  explicit ArgumentTypeError(std::string msg) noexcept : SpindleException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace spindle
