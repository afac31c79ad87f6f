/***
 * Name: fastnum::support::Pow10Table
 * Purpose: Precomputed powers of ten for the exponents and fraction lengths that dominate
 *   real-world literals.
 * Inputs: Exponent or fractional digit count
 * Outputs: 10^exponent or 10^-count as double
 * Theory of Operation:
 *   One immutable instance is built on first use (function-local static) and shared by
 *   const reference. Values inside the table bounds are plain loads; values outside fall
 *   back to std::pow.
 */
#pragma once

#include <array>
#include <cstddef>

namespace fastnum {
namespace support {

class Pow10Table {
 public:
  static constexpr int kExponentTableMin = -10;
  static constexpr int kExponentTableMax = 10;
  static constexpr int kMaxFractionalDigits = 10;

  static const Pow10Table& Instance();

  /*** PowerOf10: 10^exponent; table lookup within [kExponentTableMin, kExponentTableMax]. */
  double PowerOf10(int exponent) const;

  /*** ScaleForFractionalDigits: 10^-digit_count; table lookup for 1..kMaxFractionalDigits. */
  double ScaleForFractionalDigits(int digit_count) const;

  Pow10Table(const Pow10Table&) = delete;
  Pow10Table& operator=(const Pow10Table&) = delete;

 private:
  Pow10Table();

  std::array<double, static_cast<std::size_t>(kExponentTableMax - kExponentTableMin + 1)> by_exponent_{};
  std::array<double, static_cast<std::size_t>(kMaxFractionalDigits + 1)> inverse_{};
};

/*** PowerOf10: Shorthand for Pow10Table::Instance().PowerOf10(exponent). */
double PowerOf10(int exponent);

/*** ScaleForFractionalDigits: Shorthand for Pow10Table::Instance().ScaleForFractionalDigits(n). */
double ScaleForFractionalDigits(int digit_count);

}  // namespace support
}  // namespace fastnum
