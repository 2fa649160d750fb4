#pragma once

#include <tandem/timers/processor.hpp>

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/stdlike/mutex.hpp>
#include <twist/ed/stdlike/thread.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace tandem::timers {

// Takes up one thread to process timers

class StandaloneProcessor : public IProcessor {
  using SteadyClock = std::chrono::steady_clock;

 public:
  StandaloneProcessor();
  ~StandaloneProcessor() override;

  // Pinned
  StandaloneProcessor(const StandaloneProcessor&) = delete;
  StandaloneProcessor& operator=(const StandaloneProcessor&) = delete;

  StandaloneProcessor(StandaloneProcessor&&) = delete;
  StandaloneProcessor& operator=(StandaloneProcessor&&) = delete;

  // IProcessor
  void AddTimer(TimerBase* timer) override;

  size_t PendingCount();

  // Idempotent, pending timers are discarded
  void Stop();

 private:
  void WorkerLoop();

  // nullopt if no timers left
  std::optional<Millis> RunReadyTimers();

  void DiscardAll();

  void WakeWorker();

 private:
  twist::ed::stdlike::mutex mutex_;
  std::vector<TimerBase*> heap_;  // guarded by mutex_
  bool stopped_{false};           // guarded by mutex_

  twist::ed::stdlike::atomic<bool> stop_requested_{false};
  twist::ed::stdlike::atomic<uint32_t> wakeups_{0};

  // NB: Worker created last to have every
  // other constructor in hb with it
  twist::ed::stdlike::thread worker_;
};

}  // namespace tandem::timers
