/***
 * Name: spindle::exceptions::DialogueStateError
 * Purpose: Exception for driving the dialogue while it is not in a state that allows the call.
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

class DialogueStateError : public SpindleException {
 public:
  explicit DialogueStateError(std::string msg) noexcept : SpindleException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace spindle
