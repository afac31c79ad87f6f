/***
 * Name: fastnum::support::ParseInt (range)
 * Purpose: Parse text[start, end) as a base-10 integer.
 * Inputs: text, start (inclusive), end (exclusive)
 * Outputs: int value; FormatError or RangeError
 */
#include "fastnum/support/number_parse.h"

#include <cstddef>
#include <string_view>

#include "fastnum/support/parse_util.h"

namespace fastnum::support {

auto ParseInt(std::string_view text, std::size_t start, std::size_t end) -> int {
  return ParseInt(SliceRange(text, start, end));
}

}  // namespace fastnum::support
