#pragma once

#include "settle/domain/errors.hpp"
#include "settle/domain/transfer.hpp"

#include <limits>
#include <string>

namespace settle {
namespace domain {

// -----------------------------------------------------------------------------
// Checked Amount arithmetic
// -----------------------------------------------------------------------------
// Every add/subtract against a bound in the accounting path goes through
// these helpers. They throw ArithmeticOverflowError instead of wrapping.
// `what` names the quantity for the error message.
// -----------------------------------------------------------------------------

inline Amount checkedAdd(Amount a, Amount b, const char* what) {
  if (b > std::numeric_limits<Amount>::max() - a) {
    throw ArithmeticOverflowError(std::string("Overflow in ") + what);
  }
  return a + b;
}

inline Amount checkedSub(Amount a, Amount b, const char* what) {
  if (b > a) {
    throw ArithmeticOverflowError(std::string("Underflow in ") + what);
  }
  return a - b;
}

}  // namespace domain
}  // namespace settle
