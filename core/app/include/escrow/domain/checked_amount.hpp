#pragma once

#include "escrow/domain/engine_error.hpp"
#include "escrow/domain/types.hpp"

#include <limits>
#include <string>

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// checkedAdd
// -----------------------------------------------------------------------------
// Amount addition for ledger buckets. Overflow raises an InvariantGuard
// EngineError naming the bucket, so the unit of work rolls the whole call
// back instead of wrapping.
// -----------------------------------------------------------------------------
inline Amount checkedAdd(Amount lhs, Amount rhs, const char* what) {
  if (rhs > std::numeric_limits<Amount>::max() - lhs) {
    throw EngineError(ErrorKind::InvariantGuard,
                      std::string("Amount overflow in ") + what);
  }
  return lhs + rhs;
}

}  // namespace domain
}  // namespace escrow
