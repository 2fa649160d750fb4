#pragma once

#include <twist/ed/stdlike/atomic.hpp>

#include <wheels/intrusive/list.hpp>

namespace tandem::threads::lockfree {

// Unbounded intrusive multi-producer / single-consumer queue
// Producers push onto a lock-free stack, the consumer steals
// the whole stack at once and restores the arrival order

template <typename T>
class IntrusiveMPSCQueue {
 public:
  using Node = wheels::IntrusiveListNode<T>;

  IntrusiveMPSCQueue() = default;

  // Pinned
  IntrusiveMPSCQueue(const IntrusiveMPSCQueue&) = delete;
  IntrusiveMPSCQueue& operator=(const IntrusiveMPSCQueue&) = delete;

  IntrusiveMPSCQueue(IntrusiveMPSCQueue&&) = delete;
  IntrusiveMPSCQueue& operator=(IntrusiveMPSCQueue&&) = delete;

  // Any thread
  void Push(Node* node) {
    Node* top = top_.load(std::memory_order::relaxed);

    do {
      node->next_ = top;
      // release: node contents must be visible to the consumer
    } while (!top_.compare_exchange_weak(top, node, std::memory_order::release,
                                         std::memory_order::relaxed));
  }

  // Single consumer
  // Appends every pushed item to the tail of `list` in arrival order
  // Returns the number of imported items
  size_t TakeAllInto(wheels::IntrusiveList<T>& list) {
    Node* stolen = top_.exchange(nullptr, std::memory_order::acquire);

    // Reverse stack
    Node* head = nullptr;
    while (stolen != nullptr) {
      Node* next = stolen->next_;
      stolen->next_ = head;
      head = stolen;
      stolen = next;
    }

    size_t count = 0;

    while (head != nullptr) {
      Node* next = head->next_;
      head->next_ = head->prev_ = nullptr;

      list.PushBack(head);
      ++count;

      head = next;
    }

    return count;
  }

  bool IsEmpty() const {
    return top_.load(std::memory_order::seq_cst) == nullptr;
  }

  bool NonEmpty() const {
    return !IsEmpty();
  }

 private:
  twist::ed::stdlike::atomic<Node*> top_{nullptr};
};

}  // namespace tandem::threads::lockfree
