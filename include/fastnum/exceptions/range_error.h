/***
 * Name: fastnum::exceptions::RangeError
 * Purpose: Exception for an invalid [start, end) index pair.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from FastnumException.
 */
#pragma once

#include <string>
#include <utility>

#include "fastnum/exceptions/fastnum_exception.h"

namespace fastnum {
namespace exceptions {

class RangeError : public FastnumException {
 public:
  explicit RangeError(std::string msg) noexcept : FastnumException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace fastnum
