#include <tandem/threads/lockfree/intrusive_mpsc_queue.hpp>

#include <wheels/test/framework.hpp>

#include <twist/ed/stdlike/thread.hpp>

#include <deque>
#include <vector>

struct Item : public wheels::IntrusiveListNode<Item> {
  explicit Item(int v)
      : value(v) {
  }

  int value;
};

using Queue = tandem::threads::lockfree::IntrusiveMPSCQueue<Item>;

TEST_SUITE(IntrusiveMPSCQueue) {
  SIMPLE_TEST(JustWorks) {
    Queue queue;
    ASSERT_TRUE(queue.IsEmpty());

    Item item{1};
    queue.Push(&item);
    ASSERT_TRUE(queue.NonEmpty());

    wheels::IntrusiveList<Item> list;
    ASSERT_EQ(queue.TakeAllInto(list), 1);

    ASSERT_TRUE(queue.IsEmpty());
    ASSERT_EQ(list.PopFront()->value, 1);
    ASSERT_TRUE(list.IsEmpty());
  }

  SIMPLE_TEST(Fifo) {
    Queue queue;

    Item first{1};
    Item second{2};
    Item third{3};

    queue.Push(&first);
    queue.Push(&second);
    queue.Push(&third);

    wheels::IntrusiveList<Item> list;
    queue.TakeAllInto(list);

    ASSERT_EQ(list.PopFront()->value, 1);
    ASSERT_EQ(list.PopFront()->value, 2);
    ASSERT_EQ(list.PopFront()->value, 3);
  }

  SIMPLE_TEST(AppendsToTail) {
    Queue queue;

    Item head{0};
    Item first{1};
    Item second{2};

    wheels::IntrusiveList<Item> list;
    list.PushBack(&head);

    queue.Push(&first);
    queue.Push(&second);

    ASSERT_EQ(queue.TakeAllInto(list), 2);

    ASSERT_EQ(list.PopFront()->value, 0);
    ASSERT_EQ(list.PopFront()->value, 1);
    ASSERT_EQ(list.PopFront()->value, 2);
  }

  SIMPLE_TEST(Empty) {
    Queue queue;

    wheels::IntrusiveList<Item> list;
    ASSERT_EQ(queue.TakeAllInto(list), 0);
    ASSERT_TRUE(list.IsEmpty());
  }

  SIMPLE_TEST(ConcurrentProducers) {
    Queue queue;

    static const int kProducers = 4;
    static const int kItems = 1000;

    std::vector<std::deque<Item>> items(kProducers);
    for (int i = 0; i < kProducers; ++i) {
      for (int j = 0; j < kItems; ++j) {
        items[i].emplace_back(i * kItems + j);
      }
    }

    std::vector<twist::ed::stdlike::thread> producers;
    for (int i = 0; i < kProducers; ++i) {
      producers.emplace_back([&queue, &items, i] {
        for (auto& item : items[i]) {
          queue.Push(&item);
        }
      });
    }

    for (auto& producer : producers) {
      producer.join();
    }

    wheels::IntrusiveList<Item> list;
    ASSERT_EQ(queue.TakeAllInto(list), kProducers * kItems);

    // Per-producer order is preserved
    std::vector<int> last(kProducers, -1);

    while (Item* item = list.PopFront()) {
      int producer = item->value / kItems;
      ASSERT_LT(last[producer], item->value);
      last[producer] = item->value;
    }
  }
}

RUN_ALL_TESTS()
