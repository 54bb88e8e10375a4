// Repository: NarroVault
// Component: Wait Strategy Interface
// Purpose: Decouple backoff sleeping from retry math in the orchestrator.
//          Production: RealtimeWaitStrategy sleeps.
//          Tests: a recording strategy captures the delays without sleeping.
// Copyright (c) 2026 NarroVault

#ifndef NARROVAULT_ORCHESTRATOR_IWAIT_STRATEGY_HPP_
#define NARROVAULT_ORCHESTRATOR_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace narrovault::orchestrator {

class IWaitStrategy {
 public:
  virtual void WaitFor(std::chrono::milliseconds delay) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitFor(std::chrono::milliseconds delay) override {
    std::this_thread::sleep_for(delay);
  }
};

}  // namespace narrovault::orchestrator

#endif  // NARROVAULT_ORCHESTRATOR_IWAIT_STRATEGY_HPP_
