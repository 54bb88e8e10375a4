// Repository: NarroVault
// Component: Call gate
// Purpose: Counting gate that caps concurrent external calls and records the
//          peak number in flight.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ORCHESTRATOR_CALL_GATE_HPP_
#define NARROVAULT_ORCHESTRATOR_CALL_GATE_HPP_

#include <condition_variable>
#include <mutex>

namespace narrovault::orchestrator {

class CallGate {
 public:
  explicit CallGate(int capacity) : capacity_(capacity > 0 ? capacity : 1) {}

  CallGate(const CallGate&) = delete;
  CallGate& operator=(const CallGate&) = delete;

  void Acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_flight_ < capacity_; });
    ++in_flight_;
    if (in_flight_ > peak_) peak_ = in_flight_;
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --in_flight_;
    }
    cv_.notify_one();
  }

  int capacity() const { return capacity_; }

  int InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
  }

  int Peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
  }

 private:
  const int capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  int in_flight_ = 0;
  int peak_ = 0;
};

// Holds one gate slot for a scope.
class CallGateSlot {
 public:
  explicit CallGateSlot(CallGate& gate) : gate_(gate) { gate_.Acquire(); }
  ~CallGateSlot() { gate_.Release(); }

  CallGateSlot(const CallGateSlot&) = delete;
  CallGateSlot& operator=(const CallGateSlot&) = delete;

 private:
  CallGate& gate_;
};

}  // namespace narrovault::orchestrator

#endif  // NARROVAULT_ORCHESTRATOR_CALL_GATE_HPP_
