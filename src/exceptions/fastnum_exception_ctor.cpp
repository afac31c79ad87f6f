/***
 * Name: fastnum::exceptions::FastnumException::FastnumException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "fastnum/exceptions/fastnum_exception.h"

#include <utility>

namespace fastnum {
namespace exceptions {

FastnumException::FastnumException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace fastnum
