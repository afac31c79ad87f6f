/***
 * Name: fastnum::support (parse_util)
 * Purpose: Building blocks shared by ParseInt and ParseDouble.
 * Inputs: std::string_view slices of the literal being parsed
 * Outputs: Mutated views, accumulated values; FormatError on malformed input
 * Theory of Operation: Each helper works on a view that was already narrowed to its
 *   part of the literal, so no substring is ever copied on the success path.
 */
#pragma once

#include <cstddef>
#include <string_view>

namespace fastnum {
namespace support {

/*** SliceRange: Narrow text to [start, end). Throws RangeError on an invalid pair. */
std::string_view SliceRange(std::string_view text, std::size_t start, std::size_t end);

/*** ConsumeSign: Drop a leading '-' (or '+' when allow_plus); return true if one was consumed. */
bool ConsumeSign(std::string_view& text, bool& is_negative, bool allow_plus);

/***
 * ParseDigitsStrict: Accumulate a non-empty run of ASCII digits with unsigned wrap-around.
 * `context` is reported as the input of any FormatError.
 */
unsigned int ParseDigitsStrict(std::string_view digits, std::string_view context);

/*** IndexOfExponentMarker: Position of the first 'e' or 'E', or text.size() if absent. */
std::size_t IndexOfExponentMarker(std::string_view text);

/*** ParseMantissaOnly: Parse ['-'] digits ['.' digits] with no exponent marker. */
double ParseMantissaOnly(std::string_view text);

/*** ParseExponentAfterE: Parse an optional sign then an integer literal after the marker; signs combine. */
int ParseExponentAfterE(std::string_view exponent_text);

}  // namespace support
}  // namespace fastnum
