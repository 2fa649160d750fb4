#pragma once

#include <tandem/dispatch/object.hpp>
#include <tandem/dispatch/queue.hpp>

#include <tandem/metrics/active.hpp>
#include <tandem/metrics/collector.hpp>

#include <tandem/threads/lockfree/intrusive_mpsc_queue.hpp>

#include <twist/ed/stdlike/atomic.hpp>
#include <twist/ed/stdlike/mutex.hpp>

#include <wheels/intrusive/list.hpp>

#include <memory>
#include <optional>
#include <string>

namespace tandem::dispatch {

// Serial queue / strand with a name
//
// Tasks submitted to one queue never run concurrently and start in
// submission order (per producer). The queue does not own a thread:
// each drain is a task submitted to the target queue, at most one
// drain per queue is pending or running at any time.
//
// Tasks submitted by a task of this queue skip synchronization and run
// in the current drain, after the tasks already imported into it.

class SerialQueue : public IQueue,
                    public DispatchObject,
                    public executors::Task {
 public:
  explicit SerialQueue(std::string label, IQueue* target = nullptr);
  ~SerialQueue() override;

  // Non-copyable
  SerialQueue(const SerialQueue&) = delete;
  SerialQueue& operator=(const SerialQueue&) = delete;

  // Non-movable
  SerialQueue(SerialQueue&&) = delete;
  SerialQueue& operator=(SerialQueue&&) = delete;

  // IExecutor
  void Submit(executors::Task* task) override;

  // IQueue
  QueueType Type() const override {
    return QueueType::Serial;
  }

  std::string Label() const override;
  void SetLabel(std::string label) override;
  std::string ToString() const override;

  IQueue* GetTargetQueue() const override;
  Dispatcher& GetDispatcher() override;

  void ExecuteAfter(timers::Millis delay, executors::Function fun) override;

  // Hierarchy

  // Non-owning, target must outlive this queue
  void SetTargetQueue(IQueue* target);

  // Child queue targeting this one
  std::unique_ptr<SerialQueue> CreateQueue(std::string label);

  // Reentrancy

  // True iff the calling thread is draining this queue
  bool IsExecuting() const;

  void AssertExecuting();

  // Profiling

  void Profile(bool on);

  bool IsProfiled() const;

  // Activity since the previous call, empty while not profiled
  std::optional<metrics::QueueMetrics> Metrics();

 protected:
  void OnStartup() override;
  void OnResume() override;

 private:
  // Drain routine, invoked by the target queue
  void Run() noexcept override;

  void Enqueue(executors::Task* task);

  void TriggerExecution();

  void RunTask(executors::Task* task) noexcept;

 private:
  // Everything a drain touches after its last task,
  // shared since the queue may be destroyed by then
  struct DrainState {
    // True iff a drain is pending or running
    twist::ed::stdlike::atomic<bool> scheduled{false};

    // Submissions from outside of the drain
    threads::lockfree::IntrusiveMPSCQueue<executors::Task> inbound;

    // Touched only by the draining thread
    wheels::IntrusiveList<executors::Task> ordered;
  };

  std::shared_ptr<DrainState> state_;

  twist::ed::stdlike::atomic<IQueue*> target_;

  twist::ed::stdlike::atomic<metrics::IMetricsCollector*> collector_;

  mutable twist::ed::stdlike::mutex mutex_;
  std::string label_;                                // guarded by mutex_
  std::shared_ptr<metrics::ActiveCollector> profiler_;  // guarded by mutex_
  Dispatcher* tracked_by_{nullptr};                  // guarded by mutex_
};

}  // namespace tandem::dispatch
