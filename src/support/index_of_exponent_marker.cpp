/***
 * Name: fastnum::support::IndexOfExponentMarker
 * Purpose: Locate the scientific-notation marker in a literal.
 * Inputs: text view
 * Outputs: index of the first 'e' or 'E'; text.size() when there is none
 */
#include "fastnum/support/parse_util.h"

#include <cstddef>
#include <string_view>

namespace fastnum::support {

auto IndexOfExponentMarker(std::string_view text) -> std::size_t {
  for (std::size_t index = 0; index < text.size(); ++index) {
    if (text[index] == 'e' || text[index] == 'E') {
      return index;
    }
  }
  return text.size();
}

}  // namespace fastnum::support
