#include <tandem/executors/thread_pool.hpp>

#include <twist/ed/local/ptr.hpp>

#include <wheels/core/assert.hpp>
#include <wheels/core/panic.hpp>

namespace tandem::executors {

static twist::ed::ThreadLocalPtr<ThreadPool> pool;

ThreadPool::ThreadPool(size_t num_threads)
    : num_threads_(num_threads) {
  WHEELS_VERIFY(num_threads > 0, "Thread pool needs at least one worker");
}

void ThreadPool::Start() {
  WHEELS_VERIFY(workers_.empty(), "Thread pool is already started");

  for (size_t i = 0; i < num_threads_; ++i) {
    workers_.emplace_back([this] {
      Worker();
    });
  }
}

// Tasks submitted directly to the pool must not throw
void ThreadPool::Worker() noexcept {
  pool = this;

  while (Task* next = tasks_.Take()) {
    next->Run();

    incomplete_tasks_.Done();
  }
}

ThreadPool::~ThreadPool() {
  WHEELS_VERIFY(workers_.empty(), "Thread pool is not stopped");
}

void ThreadPool::Submit(Task* task) {
  incomplete_tasks_.Add(1);

  if (!tasks_.Put(task)) {
    WHEELS_PANIC("Submit to a stopped thread pool");
  }
}

ThreadPool* ThreadPool::Current() {
  return pool;
}

void ThreadPool::WaitIdle() {
  incomplete_tasks_.Wait();
}

void ThreadPool::Stop() {
  tasks_.Close();

  for (auto& worker : workers_) {
    worker.join();
  }

  workers_.clear();
}

}  // namespace tandem::executors
