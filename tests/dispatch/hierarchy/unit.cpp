#include <tandem/dispatch/dispatcher.hpp>
#include <tandem/dispatch/errors.hpp>

#include <tandem/executors/manual.hpp>
#include <tandem/executors/submit.hpp>

#include <tandem/threads/blocking/wait_group.hpp>

#include <wheels/test/framework.hpp>

#include <twist/ed/stdlike/atomic.hpp>

#include <string>
#include <vector>

using namespace tandem;  // NOLINT

using tandem::threads::blocking::WaitGroup;

TEST_SUITE(Hierarchy) {
  SIMPLE_TEST(ChildOverParent) {
    dispatch::Dispatcher dispatcher{dispatch::DispatcherSettings{.threads = 4}};

    auto parent = dispatcher.CreateQueue("parent");
    auto child = parent->CreateQueue("child");

    ASSERT_EQ(child->GetTargetQueue(), parent.get());
    ASSERT_EQ(&child->GetDispatcher(), &dispatcher);

    static const size_t kTasks = 17;

    WaitGroup wg;
    wg.Add(kTasks);

    for (size_t i = 0; i < kTasks; ++i) {
      executors::Submit(*child, [&] {
        wg.Done();
      });
    }

    wg.Wait();
  }

  SIMPLE_TEST(ParentAndChildSerialize) {
    dispatch::Dispatcher dispatcher{dispatch::DispatcherSettings{.threads = 8}};

    auto parent = dispatcher.CreateQueue("parent");
    auto left = parent->CreateQueue("left");
    auto right = parent->CreateQueue("right");

    static const size_t kTasks = 1000;

    twist::ed::stdlike::atomic<bool> inside{false};
    size_t counter = 0;

    WaitGroup wg;
    wg.Add(3 * kTasks);

    auto critical = [&] {
      ASSERT_FALSE(inside.exchange(true));
      ++counter;
      inside.store(false);
      wg.Done();
    };

    for (size_t i = 0; i < kTasks; ++i) {
      executors::Submit(*parent, critical);
      executors::Submit(*left, critical);
      executors::Submit(*right, critical);
    }

    wg.Wait();

    ASSERT_EQ(counter, 3 * kTasks);
  }

  SIMPLE_TEST(NestedDrainContext) {
    executors::ManualExecutor manual;
    dispatch::Dispatcher dispatcher{manual};

    auto parent = dispatcher.CreateQueue("parent");
    auto child = parent->CreateQueue("child");
    manual.Drain();

    std::vector<std::string> order;

    executors::Submit(*child, [&] {
      ASSERT_TRUE(child->IsExecuting());
      ASSERT_TRUE(parent->IsExecuting());
      ASSERT_EQ(dispatch::Dispatcher::CurrentQueue(), child.get());

      // Fast path of the parent: runs in the current parent drain
      executors::Submit(*parent, [&] {
        ASSERT_FALSE(child->IsExecuting());
        ASSERT_EQ(dispatch::Dispatcher::CurrentQueue(), parent.get());
        order.push_back("parent");
      });

      order.push_back("child");
    });

    ASSERT_EQ(manual.Drain(), 1);

    std::vector<std::string> expected{"child", "parent"};
    ASSERT_TRUE(order == expected);

    ASSERT_EQ(dispatch::Dispatcher::CurrentQueue(), nullptr);
  }

  SIMPLE_TEST(Retarget) {
    executors::ManualExecutor manual;
    dispatch::Dispatcher dispatcher{manual};

    auto first = dispatcher.CreateQueue("first");
    auto second = dispatcher.CreateQueue("second");
    auto child = first->CreateQueue("child");
    manual.Drain();

    child->SetTargetQueue(second.get());

    bool done = false;

    executors::Submit(*child, [&] {
      ASSERT_TRUE(second->IsExecuting());
      ASSERT_FALSE(first->IsExecuting());
      done = true;
    });

    manual.Drain();

    ASSERT_TRUE(done);
  }

  SIMPLE_TEST(UnrootedChild) {
    dispatch::SerialQueue root{"root"};

    bool thrown = false;

    try {
      root.CreateQueue("child");
    } catch (const dispatch::NoTargetQueueError& error) {
      thrown = true;
      ASSERT_EQ(std::string{error.what()},
                "serial queue { label: \"root\" } has no target queue");
    }

    ASSERT_TRUE(thrown);
  }

  SIMPLE_TEST(UnrootedGrandchild) {
    dispatch::SerialQueue root{"root"};
    dispatch::SerialQueue child{"child", &root};

    bool thrown = false;

    try {
      child.GetDispatcher();
    } catch (const dispatch::NoTargetQueueError&) {
      thrown = true;
    }

    ASSERT_TRUE(thrown);
  }

  SIMPLE_TEST(GlobalQueueIsRoot) {
    dispatch::Dispatcher dispatcher{dispatch::DispatcherSettings{
        .threads = 2, .label = "workers"}};

    auto& global = dispatcher.GetGlobalQueue();

    ASSERT_TRUE(global.Type() == dispatch::QueueType::Global);
    ASSERT_EQ(global.GetTargetQueue(), nullptr);
    ASSERT_EQ(&global.GetDispatcher(), &dispatcher);
    ASSERT_EQ(global.ToString(), "global queue { label: \"workers\" }");
  }
}

RUN_ALL_TESTS()
