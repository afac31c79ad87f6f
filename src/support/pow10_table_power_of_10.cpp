/***
 * Name: fastnum::support::Pow10Table::PowerOf10
 * Purpose: Return 10^exponent.
 * Inputs: exponent
 * Outputs: table entry inside [kExponentTableMin, kExponentTableMax], std::pow otherwise
 */
#include "fastnum/support/pow10_table.h"

#include <cmath>
#include <cstddef>

namespace fastnum::support {

auto Pow10Table::PowerOf10(int exponent) const -> double {
  if (exponent >= kExponentTableMin && exponent <= kExponentTableMax) {
    return by_exponent_[static_cast<std::size_t>(exponent - kExponentTableMin)];
  }
  return std::pow(10.0, exponent);
}

}  // namespace fastnum::support
