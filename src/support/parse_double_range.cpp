/***
 * Name: fastnum::support::ParseDouble (range)
 * Purpose: Parse text[start, end) as a double.
 * Inputs: text, start (inclusive), end (exclusive)
 * Outputs: double value; FormatError or RangeError
 */
#include "fastnum/support/number_parse.h"

#include <cstddef>
#include <string_view>

#include "fastnum/support/parse_util.h"

namespace fastnum::support {

auto ParseDouble(std::string_view text, std::size_t start, std::size_t end) -> double {
  return ParseDouble(SliceRange(text, start, end));
}

}  // namespace fastnum::support
