#include <tandem/metrics/active.hpp>

#include <wheels/core/defer.hpp>

#include <mutex>
#include <utility>

namespace tandem::metrics {

//////////////////////////////////////////////////////////////////////

class ActiveCollector::TrackedTask : public executors::Task {
 public:
  TrackedTask(executors::Task* task, std::shared_ptr<ActiveCollector> owner)
      : task_(task),
        owner_(std::move(owner)),
        enqueued_at_(Clock::now()) {
  }

  void Run() override {
    const auto started_at = Clock::now();
    owner_->OnDequeue(started_at - enqueued_at_);

    // Failures are measured too and still reach the queue
    wheels::Defer complete([this, started_at] {
      owner_->OnComplete(Clock::now() - started_at);
      delete this;
    });

    task_->Run();
  }

 private:
  executors::Task* task_;
  std::shared_ptr<ActiveCollector> owner_;
  Clock::time_point enqueued_at_;
};

//////////////////////////////////////////////////////////////////////

ActiveCollector::ActiveCollector(std::string label)
    : label_(std::move(label)),
      interval_start_(Clock::now()) {
}

executors::Task* ActiveCollector::Track(executors::Task* task) {
  enqueued_.fetch_add(1, std::memory_order::relaxed);
  return new TrackedTask(task, shared_from_this());
}

std::optional<QueueMetrics> ActiveCollector::Snapshot() {
  QueueMetrics snapshot;

  {
    std::lock_guard guard(mutex_);

    const auto now = Clock::now();

    snapshot.label = label_;
    snapshot.duration = now - interval_start_;
    interval_start_ = now;
  }

  snapshot.enqueued = enqueued_.exchange(0, std::memory_order::relaxed);
  snapshot.dequeued = dequeued_.exchange(0, std::memory_order::relaxed);
  snapshot.max_wait_time =
      Nanos{max_wait_ns_.exchange(0, std::memory_order::relaxed)};
  snapshot.total_wait_time =
      Nanos{total_wait_ns_.exchange(0, std::memory_order::relaxed)};
  snapshot.max_run_time =
      Nanos{max_run_ns_.exchange(0, std::memory_order::relaxed)};
  snapshot.total_run_time =
      Nanos{total_run_ns_.exchange(0, std::memory_order::relaxed)};

  return snapshot;
}

void ActiveCollector::SetLabel(std::string label) {
  std::lock_guard guard(mutex_);
  label_ = std::move(label);
}

void ActiveCollector::Reset() {
  Snapshot();
}

void ActiveCollector::OnDequeue(Nanos wait_time) {
  dequeued_.fetch_add(1, std::memory_order::relaxed);
  total_wait_ns_.fetch_add(wait_time.count(), std::memory_order::relaxed);
  UpdateMax(max_wait_ns_, wait_time.count());
}

void ActiveCollector::OnComplete(Nanos run_time) {
  total_run_ns_.fetch_add(run_time.count(), std::memory_order::relaxed);
  UpdateMax(max_run_ns_, run_time.count());
}

void ActiveCollector::UpdateMax(twist::ed::stdlike::atomic<int64_t>& max,
                                int64_t value) {
  int64_t current = max.load(std::memory_order::relaxed);

  while (current < value &&
         !max.compare_exchange_weak(current, value,
                                    std::memory_order::relaxed)) {
  }
}

}  // namespace tandem::metrics
