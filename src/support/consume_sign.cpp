/***
 * Name: fastnum::support::ConsumeSign
 * Purpose: Consume a leading '-' (or '+' when allowed) and set is_negative.
 * Inputs: text (by ref), is_negative (by ref), allow_plus
 * Outputs: is_negative set; text advanced by one if a sign was found; returns true if consumed.
 */
#include "fastnum/support/parse_util.h"

#include <string_view>

namespace fastnum {
namespace support {

auto ConsumeSign(std::string_view& text, bool& is_negative, bool allow_plus) -> bool {
  is_negative = false;
  if (text.empty()) {
    return false;
  }
  if (text[0] == '-' || (allow_plus && text[0] == '+')) {
    is_negative = (text[0] == '-');
    text.remove_prefix(1);
    return true;
  }
  return false;
}

}  // namespace support
}  // namespace fastnum
