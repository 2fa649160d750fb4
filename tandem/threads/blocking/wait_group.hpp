#pragma once

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/wait/futex.hpp>

#include <cstddef>
#include <cstdint>

namespace tandem::threads::blocking {

// Reusable as long as every Add for a round happens before the round's
// last Done

class WaitGroup {
  enum State : uint32_t { WorkIsNotDone = 0, WorkIsDone = 1 };

 public:
  void Add(size_t count) {
    if (count == 0) {
      return;
    }

    if (counter_.fetch_add(count, std::memory_order::relaxed) == 0) {
      state_.store(State::WorkIsNotDone, std::memory_order::relaxed);
    }
  }

  void Done() {
    if (counter_.fetch_sub(1, std::memory_order::acq_rel) == 1) {
      // Last one wakes the waiters
      auto wake_key = twist::ed::futex::PrepareWake(state_);

      state_.store(State::WorkIsDone, std::memory_order::release);

      twist::ed::futex::WakeAll(wake_key);
    }
  }

  void Wait() {
    while (state_.load(std::memory_order::acquire) == State::WorkIsNotDone) {
      twist::ed::futex::Wait(state_, State::WorkIsNotDone,
                             std::memory_order::acquire);
    }
  }

 private:
  twist::ed::stdlike::atomic<uint64_t> counter_{0};
  twist::ed::stdlike::atomic<uint32_t> state_{State::WorkIsDone};
};

}  // namespace tandem::threads::blocking
