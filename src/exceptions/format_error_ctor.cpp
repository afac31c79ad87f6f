/***
 * Name: fastnum::exceptions::FormatError::FormatError
 * Purpose: Construct a format error from a reason and the offending input text.
 * Inputs:
 *   - reason: short failure description
 *   - input: offending range text (may be empty)
 * Outputs: Initialized exception object
 * Theory of Operation: what() text is composed once here; an empty input leaves the
 *   reason on its own ("Zero-length input").
 */
#include "fastnum/exceptions/format_error.h"

#include <string>
#include <string_view>
#include <utility>

namespace fastnum::exceptions {

static std::string ComposeMessage(const std::string& reason, std::string_view input) {
  if (input.empty()) {
    return reason;
  }
  std::string msg;
  msg.reserve(reason.size() + input.size() + 12);
  msg.append(reason).append(" in input '").append(input).append("'");
  return msg;
}

FormatError::FormatError(std::string reason, std::string_view input)
    : FastnumException(ComposeMessage(reason, input)), reason_(std::move(reason)), input_(input) {}

}  // namespace fastnum::exceptions
