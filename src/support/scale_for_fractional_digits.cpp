/***
 * Name: fastnum::support::ScaleForFractionalDigits
 * Purpose: Free-function access to the shared table's ScaleForFractionalDigits.
 */
#include "fastnum/support/pow10_table.h"

namespace fastnum::support {

auto ScaleForFractionalDigits(int digit_count) -> double {
  return Pow10Table::Instance().ScaleForFractionalDigits(digit_count);
}

}  // namespace fastnum::support
