#pragma once

#include <atomic>
#include <mutex>
#include <thread>

namespace escrow {

// -----------------------------------------------------------------------------
// CallGate: exclusive, non-reentrant entry guard for engine operations
// -----------------------------------------------------------------------------
//
// @brief  Serialises the engine's externally callable operations across
//         threads and rejects re-entry on the thread that already holds it.
//
// @details
// Every mutating SwapEngine operation opens a CallGate::Scope before it reads
// any state. Two situations can lead to a second entry while a scope is
// open:
//
//   1. Another thread (the IPC worker, a test thread) calls the engine.
//      The Scope constructor blocks on the mutex until the first call has
//      finished, so mutations never interleave.
//
//   2. The same thread calls back into the engine from inside an asset
//      transfer. Blocking would deadlock, so the Scope constructor throws a
//      Reentrancy EngineError instead. The outer call's unit of work then
//      rolls everything back when the error unwinds through it.
//
// Reads open a ReadScope. On a foreign thread it locks like a Scope; on the
// holding thread it passes through without locking, so a transfer callback
// may observe the state the outer call has already written.
//
// The gate is released on every exit path by the Scope destructor.
//
// Thread model:
//   holder_ is written only by the thread that owns mutex_, and read by any
//   thread to decide whether it is the holder. A thread can only ever find
//   its own id there if it is the holder, so the comparison is race-free.
// -----------------------------------------------------------------------------
class CallGate {
 public:
  CallGate() = default;

  CallGate(const CallGate&) = delete;
  CallGate& operator=(const CallGate&) = delete;

  // Exclusive scope for a mutating operation. `operation` names the call in
  // the Reentrancy error message.
  class Scope {
   public:
    Scope(CallGate& gate, const char* operation);
    ~Scope();

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

   private:
    CallGate& gate_;
  };

  // Shared-with-holder scope for a read.
  class ReadScope {
   public:
    explicit ReadScope(CallGate& gate);
    ~ReadScope();

    ReadScope(const ReadScope&) = delete;
    ReadScope& operator=(const ReadScope&) = delete;

   private:
    CallGate& gate_;
    bool locked_{false};
  };

  // True if the calling thread currently holds the gate.
  bool heldByCurrentThread() const;

 private:
  std::mutex mutex_;
  std::atomic<std::thread::id> holder_{};
};

}  // namespace escrow
