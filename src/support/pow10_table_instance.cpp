/***
 * Name: fastnum::support::Pow10Table::Instance
 * Purpose: Provide the process-wide, read-only power-of-ten tables.
 * Inputs: none
 * Outputs: const reference valid until process exit
 * Theory of Operation: Function-local static; the language guarantees one thread-safe
 *   construction, after which every caller only reads.
 */
#include "fastnum/support/pow10_table.h"

namespace fastnum::support {

auto Pow10Table::Instance() -> const Pow10Table& {
  static const Pow10Table table;
  return table;
}

}  // namespace fastnum::support
