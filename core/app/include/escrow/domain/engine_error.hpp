#pragma once

#include <stdexcept>
#include <string>

namespace escrow {

// -----------------------------------------------------------------------------
// ErrorKind: classification of every rejected engine call
// -----------------------------------------------------------------------------
//
//   Validation      Malformed input (null id, zero amount, same-asset swap,
//                   disallowed asset, batch shape). Nothing was mutated.
//   Authorization   Wrong caller for cancel / fill / an owner action.
//   State           Nonexistent, terminal or expired order; nothing to clean;
//                   redundant admin toggle.
//   ExternalEffect  The asset backend failed, lied, or under-delivered. The
//                   enclosing unit of work was rolled back.
//   InvariantGuard  A ledger consistency check failed (fee liability
//                   underflow, amount overflow). Treated as fatal for the call.
//   Reentrancy      A mutating call was entered while another one was still
//                   running on the same thread (callback from a transfer).
// -----------------------------------------------------------------------------
enum class ErrorKind {
  Validation,
  Authorization,
  State,
  ExternalEffect,
  InvariantGuard,
  Reentrancy,
};

inline const char* errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation:     return "validation";
    case ErrorKind::Authorization:  return "authorization";
    case ErrorKind::State:          return "state";
    case ErrorKind::ExternalEffect: return "external_effect";
    case ErrorKind::InvariantGuard: return "invariant_guard";
    case ErrorKind::Reentrancy:     return "reentrancy";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// EngineError
// -----------------------------------------------------------------------------
//
// @brief  The single exception type thrown by engine operations.
//
// @details
// what() carries the human readable reason (e.g. "Order has expired"),
// kind() the category above. Callers that only need to know that a call was
// rejected can catch std::runtime_error; the CommandRouter maps kind() onto
// the JSON error reply.
//
// Throwing an EngineError from inside a unit of work unwinds through the
// UnitOfWork destructor, which restores every captured entity and aborts the
// backend unit. A caught EngineError therefore always means "no effect"
// (withdrawAllClaims documents its per-asset exception to this).
// -----------------------------------------------------------------------------
class EngineError : public std::runtime_error {
 public:
  EngineError(ErrorKind kind, const std::string& reason)
      : std::runtime_error(reason), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

 private:
  ErrorKind kind_;
};

}  // namespace escrow
