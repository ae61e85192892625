/***
 * Name: spindle::exceptions::InvalidOptionError
 * Purpose: Exception for an option selection outside an option prompt or with a stale/unknown id.
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

class InvalidOptionError : public SpindleException {
 public:
  explicit InvalidOptionError(std::string msg) noexcept : SpindleException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace spindle
