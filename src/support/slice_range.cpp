/***
 * Name: fastnum::support::SliceRange
 * Purpose: Narrow a text view to the half-open range [start, end).
 * Inputs: text, start (inclusive), end (exclusive)
 * Outputs: view of the range; RangeError when end < start or end > text.size()
 */
#include "fastnum/support/parse_util.h"

#include <cstddef>
#include <string>
#include <string_view>

#include "fastnum/exceptions/range_error.h"

namespace fastnum::support {

auto SliceRange(std::string_view text, std::size_t start, std::size_t end) -> std::string_view {
  if (start > end || end > text.size()) {
    throw exceptions::RangeError("invalid range [" + std::to_string(start) + ", " + std::to_string(end) +
                                 ") for input of length " + std::to_string(text.size()));
  }
  return text.substr(start, end - start);
}

}  // namespace fastnum::support
