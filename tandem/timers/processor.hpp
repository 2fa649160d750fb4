#pragma once

#include <tandem/timers/timer.hpp>

namespace tandem::timers {

struct IProcessor {
  virtual ~IProcessor() = default;

  // Runs timer->Run() on the processor's thread once the delay expires
  virtual void AddTimer(TimerBase* timer) = 0;
};

}  // namespace tandem::timers
