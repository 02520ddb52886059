#pragma once

#include <cstdint>
#include <string>

namespace escrow {
namespace domain {

// -----------------------------------------------------------------------------
// Identity and quantity aliases
// -----------------------------------------------------------------------------
// Responsibility: Names the value types every engine component passes around.
//
// AssetId / PrincipalId:
//   Opaque string identifiers issued by the asset backend. The empty string is
//   the "null" id and is rejected wherever a real asset or principal is
//   required (see isNull()).
//
// Amount:
//   Unsigned 64-bit integer quantity in the asset's smallest unit. The engine
//   never stores fractional amounts. Additions go through checkedAdd() in
//   domain/checked_amount.hpp so an overflow can never silently wrap.
//
// OrderId:
//   Monotonic sequence number assigned by the OrderStore. The first order is
//   0; ids are never reused.
//
// TimestampMs:
//   Milliseconds since the Unix epoch, as returned by ITimeProvider::now_ms().
// -----------------------------------------------------------------------------
using AssetId = std::string;
using PrincipalId = std::string;
using Amount = std::uint64_t;
using OrderId = std::uint64_t;
using TimestampMs = std::int64_t;

// Returns true for the null (empty) asset or principal id.
inline bool isNull(const std::string& id) { return id.empty(); }

// -----------------------------------------------------------------------------
// FeeSnapshot
// -----------------------------------------------------------------------------
// A (fee asset, fee amount) pair. Used for the global fee configuration and,
// copied by value, as the immutable fee record carried by each order. Once
// copied into an Order the snapshot is never written again, so later fee
// configuration changes cannot reach existing orders.
// -----------------------------------------------------------------------------
struct FeeSnapshot {
  AssetId asset;
  Amount amount{0};
};

}  // namespace domain
}  // namespace escrow
