/***
 * Name: fastnum::support::ParseMantissaOnly
 * Purpose: Parse the significand of a decimal literal (no exponent marker allowed).
 * Inputs:
 *   - text: ['-'] digit* ['.' digit*] with at least one digit
 * Outputs:
 *   - double value; FormatError on empty input, a second '.', a non-digit, or no digits
 * Theory of Operation:
 *   Digits before the point accumulate into integer_part and digits after it into
 *   fractional_part as an unscaled integer. The fraction is scaled once at the end by
 *   10^-count. This is a multiply-add approximation, not a correctly rounded conversion;
 *   long fractions may differ from strtod in the last bits.
 */
#include "fastnum/support/parse_util.h"

#include <cstddef>
#include <string_view>

#include "fastnum/exceptions/format_error.h"
#include "fastnum/support/pow10_table.h"

namespace fastnum::support {

auto ParseMantissaOnly(std::string_view text) -> double {
  constexpr double kBase10 = 10.0;
  constexpr std::size_t kNoDecimal = std::string_view::npos;
  if (text.empty()) {
    throw exceptions::FormatError("Zero-length input");
  }
  std::string_view body = text;
  bool is_negative = false;
  ConsumeSign(body, is_negative, false);

  double integer_part = 0.0;
  double fractional_part = 0.0;
  std::size_t decimal_pos = kNoDecimal;
  bool saw_digit = false;
  for (std::size_t index = 0; index < body.size(); ++index) {
    const char ch = body[index];
    if (ch == '.') {
      if (decimal_pos != kNoDecimal) {
        throw exceptions::FormatError("Second period", text);
      }
      decimal_pos = index;
      continue;
    }
    if (ch < '0' || ch > '9') {
      throw exceptions::FormatError("Non-numeric character", text);
    }
    const auto digit = static_cast<double>(ch - '0');
    if (decimal_pos != kNoDecimal) {
      fractional_part = (fractional_part * kBase10) + digit;
    } else {
      integer_part = (integer_part * kBase10) + digit;
    }
    saw_digit = true;
  }
  if (!saw_digit) {
    throw exceptions::FormatError("No digits", text);
  }
  if (decimal_pos != kNoDecimal) {
    const auto fractional_digit_count = static_cast<int>(body.size() - decimal_pos - 1);
    fractional_part *= ScaleForFractionalDigits(fractional_digit_count);
  }
  const double value = integer_part + fractional_part;
  return is_negative ? -value : value;
}

}  // namespace fastnum::support
