#pragma once

#include <twist/ed/stdlike/condition_variable.hpp>
#include <twist/ed/stdlike/mutex.hpp>

#include <wheels/intrusive/list.hpp>

#include <mutex>

namespace tandem::threads::blocking {

// Unbounded blocking multi-producers/multi-consumers (MPMC) intrusive queue

template <typename T>
class UnboundedBlockingQueue {
 public:
  // Returns false iff the queue was closed
  bool Put(T* item) {
    std::lock_guard lock(mutex_);

    if (!is_open_) {
      return false;
    }

    items_.PushBack(item);
    not_empty_.notify_one();

    return true;
  }

  // Returns nullptr iff the queue is closed and drained
  T* Take() {
    std::unique_lock lock(mutex_);

    while (is_open_ && items_.IsEmpty()) {
      not_empty_.wait(lock);
    }

    return items_.PopFront();
  }

  void Close() {
    std::lock_guard lock(mutex_);

    is_open_ = false;
    not_empty_.notify_all();
  }

 private:
  bool is_open_{true};                // guarded by mutex_
  wheels::IntrusiveList<T> items_;    // guarded by mutex_
  twist::ed::stdlike::mutex mutex_;
  twist::ed::stdlike::condition_variable not_empty_;
};

}  // namespace tandem::threads::blocking
