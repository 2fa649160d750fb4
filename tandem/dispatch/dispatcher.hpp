#pragma once

#include <tandem/dispatch/global_queue.hpp>
#include <tandem/dispatch/serial_queue.hpp>
#include <tandem/dispatch/settings.hpp>

#include <tandem/executors/thread_pool.hpp>

#include <tandem/metrics/metrics.hpp>

#include <tandem/timers/processors/standalone.hpp>

#include <twist/ed/stdlike/mutex.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tandem::dispatch {

// Process-wide services of a queue hierarchy:
// global queue, timers, profiling registry

class Dispatcher {
 public:
  // Owns and starts a thread pool with settings.threads workers
  explicit Dispatcher(DispatcherSettings settings = {});

  // Runs the global queue on an external executor
  explicit Dispatcher(executors::IExecutor& executor,
                      DispatcherSettings settings = {});

  ~Dispatcher();

  // Pinned
  Dispatcher(const Dispatcher&) = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  Dispatcher(Dispatcher&&) = delete;
  Dispatcher& operator=(Dispatcher&&) = delete;

  GlobalQueue& GetGlobalQueue() {
    return global_queue_;
  }

  // Started serial queue targeting `target`, the global queue by default
  std::unique_ptr<SerialQueue> CreateQueue(std::string label,
                                           IQueue* target = nullptr);

  // Queue draining on the calling thread, nullptr if none
  static IQueue* CurrentQueue();

  // Timers

  void ExecuteAfter(timers::Millis delay, IQueue& queue,
                    executors::Function fun);

  // Profiling registry

  void Track(SerialQueue& queue);
  void Untrack(SerialQueue& queue);

  // Snapshots of every profiled queue
  std::vector<metrics::QueueMetrics> Metrics();

  // Describes the calling thread's dispatch context
  std::string AssertMessage() const;

  const DispatcherSettings& Settings() const {
    return settings_;
  }

  // Waits for the owned pool to become idle and stops it,
  // pending timers are discarded. Idempotent
  void Shutdown();

 private:
  const DispatcherSettings settings_;

  std::unique_ptr<executors::ThreadPool> own_pool_;
  executors::IExecutor& executor_;

  timers::StandaloneProcessor timers_;

  GlobalQueue global_queue_;

  twist::ed::stdlike::mutex mutex_;
  std::vector<SerialQueue*> tracked_;  // guarded by mutex_
  bool shut_down_{false};              // guarded by mutex_
};

}  // namespace tandem::dispatch
