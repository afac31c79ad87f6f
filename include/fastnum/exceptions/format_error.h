/***
 * Name: fastnum::exceptions::FormatError
 * Purpose: Exception for malformed numeric input.
 * Inputs:
 *   - reason: short description of the failure (e.g. "Non-numeric character")
 *   - input: text of the range that was being parsed
 * Outputs: Exception object; what() reads "<reason> in input '<input>'"
 * Theory of Operation: Keeps reason and input apart so an outer parser can re-target the
 *   error at a wider range (WithInput) without the inner parser knowing that range.
 */
#pragma once

#include <string>
#include <string_view>

#include "fastnum/exceptions/fastnum_exception.h"

namespace fastnum {
namespace exceptions {

class FormatError : public FastnumException {
 public:
  explicit FormatError(std::string reason, std::string_view input = {});

  const std::string& Reason() const noexcept { return reason_; }
  const std::string& Input() const noexcept { return input_; }

  /*** WithInput: Copy of this error reporting `input` as the offending text. */
  FormatError WithInput(std::string_view input) const;

 private:
  std::string reason_;
  std::string input_;
};

}  // namespace exceptions
}  // namespace fastnum
