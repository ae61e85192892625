/***
 * Name: spindle::exceptions::SpindleException
 * Purpose: Base class for all spindle exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in spindle must use a custom type derived from this base.
 *   Exceptions report embedding/API misuse; script problems are Diagnostics.
 */
#pragma once

#include <exception>
#include <string>

namespace spindle {
namespace exceptions {

class SpindleException : public std::exception {
 public:
  virtual ~SpindleException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit SpindleException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace spindle
