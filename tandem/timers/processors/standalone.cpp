#include <tandem/timers/processors/standalone.hpp>

#include <twist/ed/wait/futex.hpp>

#include <algorithm>
#include <mutex>

namespace tandem::timers {

using namespace std::chrono_literals;

namespace {

// Min-heap on deadline
bool LaterDeadline(const TimerBase* lhs, const TimerBase* rhs) {
  return lhs->deadline > rhs->deadline;
}

}  // namespace

StandaloneProcessor::StandaloneProcessor()
    : worker_([this] {
        WorkerLoop();
      }) {
}

StandaloneProcessor::~StandaloneProcessor() {
  Stop();
}

void StandaloneProcessor::AddTimer(TimerBase* timer) {
  timer->deadline = SteadyClock::now() + timer->GetDelay();

  {
    std::lock_guard guard(mutex_);

    if (stopped_) {
      timer->Discard();
      return;
    }

    heap_.push_back(timer);
    std::push_heap(heap_.begin(), heap_.end(), LaterDeadline);
  }

  WakeWorker();
}

size_t StandaloneProcessor::PendingCount() {
  std::lock_guard guard(mutex_);
  return heap_.size();
}

void StandaloneProcessor::Stop() {
  {
    std::lock_guard guard(mutex_);

    if (stopped_) {
      return;
    }
    stopped_ = true;
  }

  stop_requested_.store(true, std::memory_order::release);
  WakeWorker();

  worker_.join();

  DiscardAll();
}

void StandaloneProcessor::WorkerLoop() {
  while (!stop_requested_.load(std::memory_order::acquire)) {
    // Read before polling: a timer added after the poll bumps wakeups_
    uint32_t old = wakeups_.load(std::memory_order::acquire);

    auto until_next_deadline = RunReadyTimers();

    if (stop_requested_.load(std::memory_order::acquire)) {
      break;
    }

    if (until_next_deadline) {
      Millis roundup = std::max(1ms, *until_next_deadline);
      twist::ed::futex::WaitTimed(wakeups_, old, roundup);
    } else {
      twist::ed::futex::Wait(wakeups_, old, std::memory_order::acquire);
    }
  }
}

std::optional<Millis> StandaloneProcessor::RunReadyTimers() {
  std::vector<TimerBase*> ready;
  std::optional<Millis> until_next;

  {
    std::lock_guard guard(mutex_);

    auto now = SteadyClock::now();

    while (!heap_.empty()) {
      TimerBase* next = heap_.front();

      if (next->deadline > now) {
        // Round up to avoid spinning right before the deadline
        until_next.emplace(
            std::chrono::ceil<Millis>(next->deadline - now));
        break;
      }

      std::pop_heap(heap_.begin(), heap_.end(), LaterDeadline);
      heap_.pop_back();

      ready.push_back(next);
    }
  }

  for (TimerBase* timer : ready) {
    timer->Run();
  }

  return until_next;
}

void StandaloneProcessor::DiscardAll() {
  std::vector<TimerBase*> pending;

  {
    std::lock_guard guard(mutex_);
    pending.swap(heap_);
  }

  for (TimerBase* timer : pending) {
    timer->Discard();
  }
}

void StandaloneProcessor::WakeWorker() {
  auto wake_key = twist::ed::futex::PrepareWake(wakeups_);
  wakeups_.fetch_add(1, std::memory_order::release);
  twist::ed::futex::WakeOne(wake_key);
}

}  // namespace tandem::timers
