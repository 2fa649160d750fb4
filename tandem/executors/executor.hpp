#pragma once

#include <tandem/executors/task.hpp>

namespace tandem::executors {

// Accepts a task and eventually runs it exactly once

struct IExecutor {
  virtual ~IExecutor() = default;

  virtual void Submit(Task* task) = 0;
};

}  // namespace tandem::executors
