#pragma once

#include <tandem/executors/executor.hpp>

#include <tandem/threads/blocking/unbounded_blocking_queue.hpp>
#include <tandem/threads/blocking/wait_group.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <cstddef>
#include <vector>

namespace tandem::executors {

// Fixed pool of worker threads + shared unbounded blocking queue
// Serves as the root executor of every dispatch queue hierarchy

class ThreadPool : public IExecutor {
 public:
  explicit ThreadPool(size_t threads);
  ~ThreadPool();

  // Non-copyable
  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Non-movable
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  void Start();

  // IExecutor
  void Submit(Task*) override;

  static ThreadPool* Current();

  void WaitIdle();

  void Stop();

  size_t Threads() const {
    return num_threads_;
  }

 private:
  void Worker() noexcept;

 private:
  const size_t num_threads_;
  std::vector<twist::ed::stdlike::thread> workers_;
  threads::blocking::UnboundedBlockingQueue<Task> tasks_;

  // WaitIdle
  threads::blocking::WaitGroup incomplete_tasks_;
};

}  // namespace tandem::executors
