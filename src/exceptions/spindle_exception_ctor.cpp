/***
 * Name: spindle::exceptions::SpindleException::SpindleException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "spindle/exceptions/spindle_exception.h"

#include <utility>

namespace spindle {
namespace exceptions {

SpindleException::SpindleException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace spindle
