#include "escrow/concurrent/call_gate.hpp"
#include "escrow/domain/engine_error.hpp"

#include <string>

namespace escrow {

bool CallGate::heldByCurrentThread() const {
  return holder_.load() == std::this_thread::get_id();
}

// -----------------------------------------------------------------------------
// Scope: reject same-thread re-entry, otherwise wait for the gate
// -----------------------------------------------------------------------------
CallGate::Scope::Scope(CallGate& gate, const char* operation) : gate_(gate) {
  if (gate_.heldByCurrentThread()) {
    throw EngineError(ErrorKind::Reentrancy,
                      std::string("Reentrant call to ") + operation);
  }
  gate_.mutex_.lock();
  gate_.holder_.store(std::this_thread::get_id());
}

CallGate::Scope::~Scope() {
  gate_.holder_.store(std::thread::id{});
  gate_.mutex_.unlock();
}

// -----------------------------------------------------------------------------
// ReadScope: pass through on the holding thread
// -----------------------------------------------------------------------------
CallGate::ReadScope::ReadScope(CallGate& gate) : gate_(gate) {
  if (gate_.heldByCurrentThread()) {
    return;
  }
  gate_.mutex_.lock();
  locked_ = true;
}

CallGate::ReadScope::~ReadScope() {
  if (locked_) {
    gate_.mutex_.unlock();
  }
}

}  // namespace escrow
