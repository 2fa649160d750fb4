#include <tandem/executors/manual.hpp>

namespace tandem::executors {

void ManualExecutor::Submit(Task* task) {
  queue_.PushBack(task);
  ++count_;
}

size_t ManualExecutor::RunAtMost(size_t limit) {
  size_t tasks_done = 0;

  while (tasks_done < limit && NonEmpty()) {
    Task* next = queue_.PopFront();
    --count_;

    next->Run();

    ++tasks_done;
  }

  return tasks_done;
}

size_t ManualExecutor::Drain() {
  size_t tasks_done = 0;

  while (NonEmpty()) {
    tasks_done += RunAtMost(count_);
  }

  return tasks_done;
}

}  // namespace tandem::executors
