#pragma once

#include <wheels/intrusive/list.hpp>

namespace tandem::executors {

// Run may throw: serial queues catch and report failures per task

struct ITask {
  virtual ~ITask() = default;

  virtual void Run() = 0;
};

struct Task : public ITask, public wheels::IntrusiveListNode<Task> {};

}  // namespace tandem::executors
