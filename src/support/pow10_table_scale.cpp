/***
 * Name: fastnum::support::Pow10Table::ScaleForFractionalDigits
 * Purpose: Return 10^-digit_count for scaling an accumulated fraction.
 * Inputs: digit_count (digits after the decimal point)
 * Outputs: table entry for 1..kMaxFractionalDigits, std::pow otherwise (1.0 for zero digits)
 */
#include "fastnum/support/pow10_table.h"

#include <cmath>
#include <cstddef>

namespace fastnum::support {

auto Pow10Table::ScaleForFractionalDigits(int digit_count) const -> double {
  if (digit_count > 0 && digit_count <= kMaxFractionalDigits) {
    return inverse_[static_cast<std::size_t>(digit_count)];
  }
  return std::pow(10.0, -digit_count);
}

}  // namespace fastnum::support
