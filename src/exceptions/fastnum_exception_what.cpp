/***
 * Name: fastnum::exceptions::FastnumException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "fastnum/exceptions/fastnum_exception.h"

namespace fastnum::exceptions {

const char* FastnumException::what() const noexcept { return message_.c_str(); }

}  // namespace fastnum::exceptions
