/***
 * Name: fastnum::support::TryParseInt
 * Purpose: Parse a base-10 integer without throwing.
 * Inputs:
 *   - text: literal to parse
 * Outputs:
 *   - out_val: parsed integer on success (unchanged on failure)
 *   - err: optional error message on failure
 * Theory of Operation: Wraps ParseInt and converts FormatError into a false return.
 */
#include "fastnum/support/number_parse.h"

#include <string>
#include <string_view>

#include "fastnum/exceptions/format_error.h"

namespace fastnum::support {

auto TryParseInt(std::string_view text, int& out_val, std::string* err) -> bool {
  try {
    out_val = ParseInt(text);
  } catch (const exceptions::FormatError& ex) {
    if (err != nullptr) {
      *err = ex.what();
    }
    return false;
  }
  return true;
}

}  // namespace fastnum::support
