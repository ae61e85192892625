/***
 * Name: spindle::exceptions::SpindleException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "spindle/exceptions/spindle_exception.h"

namespace spindle::exceptions {

const char* SpindleException::what() const noexcept { return message_.c_str(); }

}  // namespace spindle::exceptions
