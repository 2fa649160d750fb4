#pragma once

#include <tandem/executors/task.hpp>

#include <tandem/timers/millis.hpp>

#include <chrono>

namespace tandem::timers {

struct ITimer : public executors::ITask {
  virtual Millis GetDelay() = 0;

  // Called instead of Run if the processor stops before the deadline
  virtual void Discard() noexcept = 0;
};

struct TimerBase : public ITimer {
  std::chrono::steady_clock::time_point deadline;
};

}  // namespace tandem::timers
