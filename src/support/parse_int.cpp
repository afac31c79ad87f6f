/***
 * Name: fastnum::support::ParseInt
 * Purpose: Parse a base-10 integer from the whole view.
 * Inputs:
 *   - text: optional '-' followed by ASCII digits
 * Outputs:
 *   - int value; FormatError on empty input, a lone sign, or any non-digit
 * Theory of Operation: Accumulate via ParseDigitsStrict, negate in unsigned space, then
 *   reinterpret as int. Overflow wraps silently (e.g. "2147483648" yields INT_MIN).
 */
#include "fastnum/support/number_parse.h"

#include <string_view>

#include "fastnum/exceptions/format_error.h"
#include "fastnum/support/parse_util.h"

namespace fastnum::support {

auto ParseInt(std::string_view text) -> int {
  if (text.empty()) {
    throw exceptions::FormatError("Zero-length input");
  }
  std::string_view digits = text;
  bool is_negative = false;
  ConsumeSign(digits, is_negative, false);
  unsigned int value = ParseDigitsStrict(digits, text);
  if (is_negative) {
    value = 0U - value;
  }
  return static_cast<int>(value);
}

}  // namespace fastnum::support
