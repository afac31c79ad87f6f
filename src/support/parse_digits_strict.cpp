/***
 * Name: fastnum::support::ParseDigitsStrict
 * Purpose: Accumulate contiguous base-10 digits; reject anything else.
 * Inputs: digits view (no sign), context view for error reporting
 * Outputs: accumulated value; FormatError on an empty run or a non-digit
 * Theory of Operation: Unsigned arithmetic gives well-defined modulo 2^N wrap-around,
 *   matching fixed-width integer accumulation without overflow detection.
 */
#include "fastnum/support/parse_util.h"

#include <string_view>

#include "fastnum/exceptions/format_error.h"

namespace fastnum {
namespace support {

auto ParseDigitsStrict(std::string_view digits, std::string_view context) -> unsigned int {
  constexpr unsigned int kBase10 = 10U;
  constexpr char kZeroChar = '0';
  constexpr char kNineChar = '9';
  if (digits.empty()) {
    throw exceptions::FormatError("No digits", context);
  }
  unsigned int value = 0U;
  for (const char digit_char : digits) {
    if (digit_char < kZeroChar || digit_char > kNineChar) {
      throw exceptions::FormatError("Non-numeric character", context);
    }
    value = (value * kBase10) + static_cast<unsigned int>(digit_char - kZeroChar);
  }
  return value;
}

}  // namespace support
}  // namespace fastnum
