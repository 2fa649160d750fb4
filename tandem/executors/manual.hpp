#pragma once

#include <tandem/executors/executor.hpp>

#include <wheels/intrusive/list.hpp>

#include <cstddef>

namespace tandem::executors {

// Single-threaded executor, runs tasks on demand

class ManualExecutor : public IExecutor {
 public:
  ManualExecutor() = default;

  // Non-copyable
  ManualExecutor(const ManualExecutor&) = delete;
  ManualExecutor& operator=(const ManualExecutor&) = delete;

  // Non-movable
  ManualExecutor(ManualExecutor&&) = delete;
  ManualExecutor& operator=(ManualExecutor&&) = delete;

  // IExecutor
  void Submit(Task* task) override;

  // Run tasks

  // Returns false iff there was nothing to run
  bool RunNext() {
    return RunAtMost(1) == 1;
  }

  size_t RunAtMost(size_t limit);

  // Runs tasks until the queue is empty, including the ones
  // submitted by the running tasks
  size_t Drain();

  size_t TaskCount() const {
    return count_;
  }

  bool IsEmpty() const {
    return count_ == 0;
  }

  bool NonEmpty() const {
    return !IsEmpty();
  }

 private:
  wheels::IntrusiveList<Task> queue_;
  size_t count_{0};
};

}  // namespace tandem::executors
