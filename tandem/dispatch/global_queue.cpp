#include <tandem/dispatch/global_queue.hpp>
#include <tandem/dispatch/dispatcher.hpp>

#include <wheels/core/assert.hpp>

#include <fmt/core.h>

#include <mutex>
#include <utility>

namespace tandem::dispatch {

GlobalQueue::GlobalQueue(Dispatcher& dispatcher,
                         executors::IExecutor& executor, std::string label)
    : dispatcher_(dispatcher),
      executor_(executor),
      label_(std::move(label)) {
}

void GlobalQueue::Submit(executors::Task* task) {
  WHEELS_VERIFY(task != nullptr, "Null task submitted to " << ToString());
  executor_.Submit(task);
}

std::string GlobalQueue::Label() const {
  std::lock_guard guard(mutex_);
  return label_;
}

void GlobalQueue::SetLabel(std::string label) {
  std::lock_guard guard(mutex_);
  label_ = std::move(label);
}

std::string GlobalQueue::ToString() const {
  return fmt::format("global queue {{ label: \"{}\" }}", Label());
}

void GlobalQueue::ExecuteAfter(timers::Millis delay, executors::Function fun) {
  dispatcher_.ExecuteAfter(delay, *this, std::move(fun));
}

}  // namespace tandem::dispatch
