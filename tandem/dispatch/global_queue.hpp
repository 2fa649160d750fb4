#pragma once

#include <tandem/dispatch/queue.hpp>

#include <twist/ed/stdlike/mutex.hpp>

#include <string>

namespace tandem::dispatch {

// Root of a queue hierarchy: forwards tasks to the dispatcher's executor
// No ordering guarantees between tasks

class GlobalQueue : public IQueue {
 public:
  GlobalQueue(Dispatcher& dispatcher, executors::IExecutor& executor,
              std::string label);

  // Pinned
  GlobalQueue(const GlobalQueue&) = delete;
  GlobalQueue& operator=(const GlobalQueue&) = delete;

  GlobalQueue(GlobalQueue&&) = delete;
  GlobalQueue& operator=(GlobalQueue&&) = delete;

  // IExecutor
  void Submit(executors::Task* task) override;

  // IQueue
  QueueType Type() const override {
    return QueueType::Global;
  }

  std::string Label() const override;
  void SetLabel(std::string label) override;
  std::string ToString() const override;

  IQueue* GetTargetQueue() const override {
    return nullptr;
  }

  Dispatcher& GetDispatcher() override {
    return dispatcher_;
  }

  void ExecuteAfter(timers::Millis delay, executors::Function fun) override;

 private:
  Dispatcher& dispatcher_;
  executors::IExecutor& executor_;

  mutable twist::ed::stdlike::mutex mutex_;
  std::string label_;  // guarded by mutex_
};

}  // namespace tandem::dispatch
