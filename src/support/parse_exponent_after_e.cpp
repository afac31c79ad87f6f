/***
 * Name: fastnum::support::ParseExponentAfterE
 * Purpose: Parse the signed exponent that follows an 'e'/'E' marker.
 * Inputs:
 *   - exponent_text: everything after the marker
 * Outputs:
 *   - int exponent; FormatError when nothing follows the marker, only a sign follows,
 *     or the rest is not a valid ParseInt literal
 * Theory of Operation: An optional '+'/'-' is consumed, then the remainder goes through
 *   ParseInt, which accepts its own leading '-'. The two signs combine, so "--5" is 5
 *   and "+-5" is -5, while "-+5" fails. Errors carry only the exponent slice; ParseDouble
 *   widens them to the full literal.
 */
#include "fastnum/support/parse_util.h"

#include <string_view>

#include "fastnum/exceptions/format_error.h"
#include "fastnum/support/number_parse.h"

namespace fastnum::support {

auto ParseExponentAfterE(std::string_view exponent_text) -> int {
  if (exponent_text.empty()) {
    throw exceptions::FormatError("Exponent expected after 'e'");
  }
  std::string_view digits = exponent_text;
  bool is_negative = false;
  ConsumeSign(digits, is_negative, true);
  if (digits.empty()) {
    throw exceptions::FormatError("Exponent digits expected", exponent_text);
  }
  auto value = static_cast<unsigned int>(ParseInt(digits));
  if (is_negative) {
    value = 0U - value;
  }
  return static_cast<int>(value);
}

}  // namespace fastnum::support
