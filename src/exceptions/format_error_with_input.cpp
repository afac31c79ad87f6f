/***
 * Name: fastnum::exceptions::FormatError::WithInput
 * Purpose: Re-target a format error at a different input range.
 * Inputs:
 *   - input: text to report as the offending input
 * Outputs: New FormatError with the same reason
 * Theory of Operation: Used by ParseDouble to report exponent errors against the whole literal.
 */
#include "fastnum/exceptions/format_error.h"

#include <string_view>

namespace fastnum::exceptions {

FormatError FormatError::WithInput(std::string_view input) const { return FormatError(reason_, input); }

}  // namespace fastnum::exceptions
