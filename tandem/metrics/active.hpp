#pragma once

#include <tandem/metrics/collector.hpp>

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/stdlike/mutex.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace tandem::metrics {

// Wraps every task to measure wait and run times
// Counters are reset by every Snapshot
// Shared with the tracked tasks: they may complete after the queue is gone

class ActiveCollector : public IMetricsCollector,
                        public std::enable_shared_from_this<ActiveCollector> {
  using Clock = std::chrono::steady_clock;

  class TrackedTask;

 public:
  explicit ActiveCollector(std::string label);

  // Pinned
  ActiveCollector(const ActiveCollector&) = delete;
  ActiveCollector& operator=(const ActiveCollector&) = delete;

  ActiveCollector(ActiveCollector&&) = delete;
  ActiveCollector& operator=(ActiveCollector&&) = delete;

  // IMetricsCollector
  executors::Task* Track(executors::Task* task) override;
  std::optional<QueueMetrics> Snapshot() override;

  void SetLabel(std::string label);

  // Drops the accumulated counters and restarts the interval
  void Reset();

 private:
  void OnDequeue(Nanos wait_time);
  void OnComplete(Nanos run_time);

  static void UpdateMax(twist::ed::stdlike::atomic<int64_t>& max,
                        int64_t value);

 private:
  twist::ed::stdlike::mutex mutex_;
  std::string label_;                   // guarded by mutex_
  Clock::time_point interval_start_;    // guarded by mutex_

  twist::ed::stdlike::atomic<uint64_t> enqueued_{0};
  twist::ed::stdlike::atomic<uint64_t> dequeued_{0};
  twist::ed::stdlike::atomic<int64_t> max_wait_ns_{0};
  twist::ed::stdlike::atomic<int64_t> total_wait_ns_{0};
  twist::ed::stdlike::atomic<int64_t> max_run_ns_{0};
  twist::ed::stdlike::atomic<int64_t> total_run_ns_{0};
};

}  // namespace tandem::metrics
