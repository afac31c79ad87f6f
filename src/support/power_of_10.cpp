/***
 * Name: fastnum::support::PowerOf10
 * Purpose: Free-function access to the shared table's PowerOf10.
 */
#include "fastnum/support/pow10_table.h"

namespace fastnum::support {

auto PowerOf10(int exponent) -> double { return Pow10Table::Instance().PowerOf10(exponent); }

}  // namespace fastnum::support
