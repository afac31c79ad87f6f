/***
 * Name: fastnum::support::Pow10Table::Pow10Table
 * Purpose: Populate the power-of-ten lookup tables.
 * Inputs: none
 * Outputs: by_exponent_[i] = 10^(kExponentTableMin + i); inverse_[d] = 10^-d, inverse_[0] = 0
 * Theory of Operation: Runs exactly once, from Instance().
 */
#include "fastnum/support/pow10_table.h"

#include <cmath>
#include <cstddef>

namespace fastnum::support {

Pow10Table::Pow10Table() {
  constexpr double kBase10 = 10.0;
  for (std::size_t index = 0; index < by_exponent_.size(); ++index) {
    by_exponent_[index] = std::pow(kBase10, kExponentTableMin + static_cast<int>(index));
  }
  inverse_[0] = 0.0;
  for (std::size_t digits = 1; digits < inverse_.size(); ++digits) {
    inverse_[digits] = std::pow(kBase10, -static_cast<int>(digits));
  }
}

}  // namespace fastnum::support
