/***
 * Name: fastnum::support::TryParseDouble
 * Purpose: Parse a decimal literal without throwing.
 * Inputs:
 *   - text: literal to parse
 * Outputs:
 *   - out_val: parsed double on success (unchanged on failure)
 *   - err: optional error message on failure
 * Theory of Operation: Wraps ParseDouble and converts FormatError into a false return.
 */
#include "fastnum/support/number_parse.h"

#include <string>
#include <string_view>

#include "fastnum/exceptions/format_error.h"

namespace fastnum::support {

auto TryParseDouble(std::string_view text, double& out_val, std::string* err) -> bool {
  try {
    out_val = ParseDouble(text);
  } catch (const exceptions::FormatError& ex) {
    if (err != nullptr) {
      *err = ex.what();
    }
    return false;
  }
  return true;
}

}  // namespace fastnum::support
