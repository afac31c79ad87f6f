/***
 * Name: fastnum::support (number_parse)
 * Purpose: Parse base-10 integers and doubles directly from a character range.
 * Inputs: Text view, optionally narrowed by a half-open [start, end) index pair
 * Outputs: Parsed int or double; FormatError on malformed input
 * Theory of Operation:
 *   Integers accept an optional '-' followed by digits and wrap on overflow like
 *   32-bit two's complement arithmetic. Doubles accept
 *   ['-'] digit* ['.' digit*] [('e'|'E') ['+'|'-'] digit+] with at least one
 *   mantissa digit. No whitespace trimming, locale handling, NaN or Infinity.
 *   Powers of ten come from Pow10Table for small exponents.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace fastnum {
namespace support {

/*** ParseInt: Parse the whole view as a base-10 int. Throws FormatError. */
int ParseInt(std::string_view text);

/*** ParseInt: Parse text[start, end) as a base-10 int. Throws FormatError or RangeError. */
int ParseInt(std::string_view text, std::size_t start, std::size_t end);

/*** ParseDouble: Parse the whole view as a double. Throws FormatError. */
double ParseDouble(std::string_view text);

/*** ParseDouble: Parse text[start, end) as a double. Throws FormatError or RangeError. */
double ParseDouble(std::string_view text, std::size_t start, std::size_t end);

/*** TryParseInt: Non-throwing ParseInt; sets err to the error text on failure. */
bool TryParseInt(std::string_view text, int& out_val, std::string* err = nullptr);

/*** TryParseDouble: Non-throwing ParseDouble; sets err to the error text on failure. */
bool TryParseDouble(std::string_view text, double& out_val, std::string* err = nullptr);

}  // namespace support
}  // namespace fastnum
