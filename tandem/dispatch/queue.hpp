#pragma once

#include <tandem/executors/executor.hpp>
#include <tandem/executors/submit.hpp>

#include <tandem/timers/millis.hpp>

#include <string>

namespace tandem::dispatch {

class Dispatcher;

enum class QueueType {
  Global = 1,  // Backed by the dispatcher's thread pool
  Serial = 2   // Runs tasks one at a time on its target queue
};

struct IQueue : public executors::IExecutor {
  virtual QueueType Type() const = 0;

  // Diagnostics only
  virtual std::string Label() const = 0;
  virtual void SetLabel(std::string label) = 0;
  virtual std::string ToString() const = 0;

  // nullptr for roots and for queues that are not wired yet
  virtual IQueue* GetTargetQueue() const = 0;

  // Walks target queues up to the root
  // Throws NoTargetQueueError if the hierarchy is not rooted
  virtual Dispatcher& GetDispatcher() = 0;

  // Submits fun to this queue once the delay expires
  virtual void ExecuteAfter(timers::Millis delay, executors::Function fun) = 0;
};

}  // namespace tandem::dispatch
