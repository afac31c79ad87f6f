/***
 * Name: fastnum::support::ParseDouble
 * Purpose: Parse a decimal literal with optional scientific-notation exponent.
 * Inputs:
 *   - text: ['-'] digit* ['.' digit*] [('e'|'E') ['+'|'-'] digit+]
 * Outputs:
 *   - double value; FormatError on malformed input
 * Theory of Operation:
 *   Two passes: find the marker, then parse mantissa [0, e) and exponent (e, end).
 *   The result is mantissa * PowerOf10(exponent). Exponent errors are reported against
 *   the whole literal.
 */
#include "fastnum/support/number_parse.h"

#include <cstddef>
#include <string_view>

#include "fastnum/exceptions/format_error.h"
#include "fastnum/support/parse_util.h"
#include "fastnum/support/pow10_table.h"

namespace fastnum::support {

auto ParseDouble(std::string_view text) -> double {
  if (text.empty()) {
    throw exceptions::FormatError("Zero-length input");
  }
  const std::size_t marker = IndexOfExponentMarker(text);
  if (marker == text.size()) {
    return ParseMantissaOnly(text);
  }
  const double mantissa = ParseMantissaOnly(text.substr(0, marker));
  int exponent = 0;
  try {
    exponent = ParseExponentAfterE(text.substr(marker + 1));
  } catch (const exceptions::FormatError& ex) {
    throw ex.WithInput(text);
  }
  return mantissa * PowerOf10(exponent);
}

}  // namespace fastnum::support
