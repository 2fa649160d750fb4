#include <tandem/dispatch/dispatcher.hpp>

#include <tandem/satellite/satellite.hpp>

#include <wheels/core/defer.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <mutex>
#include <utility>

namespace tandem::dispatch {

//////////////////////////////////////////////////////////////////////

namespace {

// Submits its function to the queue once the delay expires

class DelayedSubmit : public timers::TimerBase {
 public:
  DelayedSubmit(timers::Millis delay, IQueue& queue, executors::Function fun)
      : delay_(delay),
        queue_(&queue),
        fun_(std::move(fun)) {
  }

  timers::Millis GetDelay() override {
    return delay_;
  }

  // Runs on the timer thread: always an external submit
  void Run() override {
    wheels::Defer cleanup([this] {
      delete this;
    });

    executors::Submit(*queue_, std::move(fun_));
  }

  void Discard() noexcept override {
    delete this;
  }

 private:
  timers::Millis delay_;
  IQueue* queue_;
  executors::Function fun_;
};

std::unique_ptr<executors::ThreadPool> StartPool(size_t threads) {
  auto pool = std::make_unique<executors::ThreadPool>(threads);
  pool->Start();
  return pool;
}

}  // namespace

//////////////////////////////////////////////////////////////////////

Dispatcher::Dispatcher(DispatcherSettings settings)
    : settings_(std::move(settings)),
      own_pool_(StartPool(settings_.threads)),
      executor_(*own_pool_),
      global_queue_(*this, executor_, settings_.label) {
}

Dispatcher::Dispatcher(executors::IExecutor& executor,
                       DispatcherSettings settings)
    : settings_(std::move(settings)),
      executor_(executor),
      global_queue_(*this, executor_, settings_.label) {
}

Dispatcher::~Dispatcher() {
  Shutdown();
}

std::unique_ptr<SerialQueue> Dispatcher::CreateQueue(std::string label,
                                                     IQueue* target) {
  if (target == nullptr) {
    target = &global_queue_;
  }

  auto queue = std::make_unique<SerialQueue>(std::move(label), target);

  if (settings_.profile) {
    queue->Profile(true);
  }

  queue->Start();

  return queue;
}

IQueue* Dispatcher::CurrentQueue() {
  return satellite::CurrentQueue();
}

void Dispatcher::ExecuteAfter(timers::Millis delay, IQueue& queue,
                              executors::Function fun) {
  timers_.AddTimer(new DelayedSubmit(delay, queue, std::move(fun)));
}

void Dispatcher::Track(SerialQueue& queue) {
  std::lock_guard guard(mutex_);

  if (std::find(tracked_.begin(), tracked_.end(), &queue) == tracked_.end()) {
    tracked_.push_back(&queue);
  }
}

void Dispatcher::Untrack(SerialQueue& queue) {
  std::lock_guard guard(mutex_);

  tracked_.erase(std::remove(tracked_.begin(), tracked_.end(), &queue),
                 tracked_.end());
}

std::vector<metrics::QueueMetrics> Dispatcher::Metrics() {
  std::lock_guard guard(mutex_);

  std::vector<metrics::QueueMetrics> snapshots;
  snapshots.reserve(tracked_.size());

  for (SerialQueue* queue : tracked_) {
    if (auto snapshot = queue->Metrics()) {
      snapshots.push_back(std::move(*snapshot));
    }
  }

  return snapshots;
}

std::string Dispatcher::AssertMessage() const {
  IQueue* current = CurrentQueue();

  return fmt::format(
      "current queue: {}",
      current != nullptr ? current->ToString() : std::string{"none"});
}

void Dispatcher::Shutdown() {
  {
    std::lock_guard guard(mutex_);

    if (shut_down_) {
      return;
    }
    shut_down_ = true;
  }

  timers_.Stop();

  if (own_pool_) {
    own_pool_->WaitIdle();
    own_pool_->Stop();
  }
}

}  // namespace tandem::dispatch
