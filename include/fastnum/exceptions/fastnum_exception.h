/***
 * Name: fastnum::exceptions::FastnumException
 * Purpose: Base class for all fastnum exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in fastnum must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace fastnum {
namespace exceptions {

class FastnumException : public std::exception {
 public:
  virtual ~FastnumException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit FastnumException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace fastnum
