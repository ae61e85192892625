/***
 * Name: spindle::exceptions::UnknownNodeError
 * Purpose: Exception for selecting a node name that the loaded program does not contain.
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

class UnknownNodeError : public SpindleException {
 public:
  explicit UnknownNodeError(std::string msg) noexcept : SpindleException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace spindle
