/***
 * Name: spindle::exceptions::ValueConversionError
 * Purpose: Exception for a Value that cannot convert to the requested kind.
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

class ValueConversionError : public SpindleException {
 public:
  explicit ValueConversionError(std::string msg) noexcept : SpindleException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace spindle
