#include <tandem/dispatch/serial_queue.hpp>
#include <tandem/dispatch/dispatcher.hpp>
#include <tandem/dispatch/errors.hpp>

#include <tandem/satellite/satellite.hpp>

#include <twist/ed/local/ptr.hpp>

#include <wheels/core/assert.hpp>

#include <fmt/core.h>

#include <exception>
#include <mutex>
#include <utility>

namespace tandem::dispatch {

//////////////////////////////////////////////////////////////////////

namespace {

// Drains running on this thread, innermost first
// (a child queue drains inside of its parent's drain)

struct DrainFrame {
  const SerialQueue* queue;
  DrainFrame* outer;
};

twist::ed::ThreadLocalPtr<DrainFrame> drain_frames;

bool IsDrainingHere(const SerialQueue* queue) {
  for (DrainFrame* frame = drain_frames; frame != nullptr;
       frame = frame->outer) {
    if (frame->queue == queue) {
      return true;
    }
  }
  return false;
}

class DrainScope {
 public:
  explicit DrainScope(SerialQueue* queue)
      : prev_queue_(satellite::SetCurrentQueue(queue)),
        frame_{queue, drain_frames} {
    drain_frames = &frame_;
  }

  // Pinned
  DrainScope(const DrainScope&) = delete;
  DrainScope& operator=(const DrainScope&) = delete;

  ~DrainScope() {
    drain_frames = frame_.outer;
    satellite::SetCurrentQueue(prev_queue_);
  }

 private:
  IQueue* prev_queue_;
  DrainFrame frame_;
};

}  // namespace

//////////////////////////////////////////////////////////////////////

SerialQueue::SerialQueue(std::string label, IQueue* target)
    : state_(std::make_shared<DrainState>()),
      target_(nullptr),
      collector_(&metrics::Inactive()),
      label_(std::move(label)) {
  SetTargetQueue(target);
}

SerialQueue::~SerialQueue() {
  std::lock_guard guard(mutex_);

  if (tracked_by_ != nullptr) {
    tracked_by_->Untrack(*this);
  }
}

void SerialQueue::Submit(executors::Task* task) {
  WHEELS_VERIFY(task != nullptr, "Null task submitted to " << ToString());

  Enqueue(collector_.load(std::memory_order::acquire)->Track(task));
}

void SerialQueue::Enqueue(executors::Task* task) {
  if (IsDrainingHere(this)) {
    // Reentrant submit: the running drain picks it up before exiting
    state_->ordered.PushBack(task);
  } else {
    state_->inbound.Push(task);
    TriggerExecution();
  }
}

void SerialQueue::TriggerExecution() {
  bool expected = false;
  if (!state_->scheduled.compare_exchange_strong(expected, true,
                                                 std::memory_order::seq_cst)) {
    // Pending or running drain is responsible for the new work
    return;
  }

  IQueue* target = target_.load(std::memory_order::acquire);

  if (target == nullptr) {
    state_->scheduled.store(false, std::memory_order::seq_cst);
    throw NoTargetQueueError(ToString());
  }

  target->Submit(this);
}

void SerialQueue::Run() noexcept {
  // Keeps the state alive after the last task:
  // the queue itself may be destroyed by then
  std::shared_ptr<DrainState> state = state_;

  bool leftovers = false;

  {
    DrainScope scope{this};

    // Import
    state->inbound.TakeAllInto(state->ordered);

    // Execute
    while (state->ordered.NonEmpty()) {
      if (IsSuspended()) {
        break;
      }

      RunTask(state->ordered.PopFront());
    }

    // After the flag reset `ordered` may belong to another drain
    leftovers = state->ordered.NonEmpty();
  }

  state->scheduled.store(false, std::memory_order::seq_cst);

  // Submitters that observed scheduled == true rely on this check
  if (leftovers || state->inbound.NonEmpty()) {
    // Suspended queue is re-triggered by OnResume
    if (!IsSuspended()) {
      TriggerExecution();
    }
  }
}

void SerialQueue::RunTask(executors::Task* task) noexcept {
  try {
    task->Run();
  } catch (...) {
    satellite::ReportFailure(*this, std::current_exception());
  }
}

void SerialQueue::OnStartup() {
  TriggerExecution();
}

void SerialQueue::OnResume() {
  TriggerExecution();
}

// Diagnostics

std::string SerialQueue::Label() const {
  std::lock_guard guard(mutex_);
  return label_;
}

void SerialQueue::SetLabel(std::string label) {
  std::lock_guard guard(mutex_);

  if (profiler_) {
    profiler_->SetLabel(label);
  }
  label_ = std::move(label);
}

std::string SerialQueue::ToString() const {
  std::string label = Label();

  if (label.empty()) {
    return "serial queue";
  }
  return fmt::format("serial queue {{ label: \"{}\" }}", label);
}

// Hierarchy

IQueue* SerialQueue::GetTargetQueue() const {
  return target_.load(std::memory_order::acquire);
}

void SerialQueue::SetTargetQueue(IQueue* target) {
  for (IQueue* ancestor = target; ancestor != nullptr;
       ancestor = ancestor->GetTargetQueue()) {
    WHEELS_VERIFY(ancestor != this,
                  "Target queue cycle through " << ToString());
  }

  target_.store(target, std::memory_order::release);
}

Dispatcher& SerialQueue::GetDispatcher() {
  IQueue* target = GetTargetQueue();

  if (target == nullptr) {
    throw NoTargetQueueError(ToString());
  }
  return target->GetDispatcher();
}

std::unique_ptr<SerialQueue> SerialQueue::CreateQueue(std::string label) {
  return GetDispatcher().CreateQueue(std::move(label), this);
}

void SerialQueue::ExecuteAfter(timers::Millis delay, executors::Function fun) {
  GetDispatcher().ExecuteAfter(delay, *this, std::move(fun));
}

// Reentrancy

bool SerialQueue::IsExecuting() const {
  return IsDrainingHere(this);
}

void SerialQueue::AssertExecuting() {
  if (IsExecuting()) {
    return;
  }

  WHEELS_PANIC(ToString() << " is not executing on this thread, "
                          << GetDispatcher().AssertMessage());
}

// Profiling

void SerialQueue::Profile(bool on) {
  // Resolved before locking: the error message reads the label
  Dispatcher* dispatcher = on ? &GetDispatcher() : nullptr;

  std::lock_guard guard(mutex_);

  if (on == IsProfiled()) {
    return;
  }

  if (on) {
    if (profiler_) {
      profiler_->Reset();
    } else {
      profiler_ = std::make_shared<metrics::ActiveCollector>(label_);
    }

    collector_.store(profiler_.get(), std::memory_order::release);

    dispatcher->Track(*this);
    tracked_by_ = dispatcher;
  } else {
    // profiler_ stays: tasks tracked so far still report to it
    collector_.store(&metrics::Inactive(), std::memory_order::release);

    tracked_by_->Untrack(*this);
    tracked_by_ = nullptr;
  }
}

bool SerialQueue::IsProfiled() const {
  return collector_.load(std::memory_order::acquire) != &metrics::Inactive();
}

std::optional<metrics::QueueMetrics> SerialQueue::Metrics() {
  return collector_.load(std::memory_order::acquire)->Snapshot();
}

}  // namespace tandem::dispatch
