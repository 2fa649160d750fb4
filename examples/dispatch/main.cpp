#include <tandem/dispatch/dispatcher.hpp>

#include <tandem/executors/manual.hpp>
#include <tandem/executors/submit.hpp>

#include <tandem/threads/blocking/wait_group.hpp>

#include <fmt/core.h>

#include <string>

using namespace std::chrono_literals;
using namespace tandem; // NOLINT

//////////////////////////////////////////////////////////////////////
/*
Serial queue is an executor which runs its tasks one at a time,
in submission order, without owning a thread.

Each queue borrows threads from its target queue.
The root of every hierarchy is the global queue of a dispatcher.
*/

//////////////////////////////////////////////////////////////////////

void SerialQueueExample() {
  fmt::print("SerialQueue Example\n");

  // Owns a pool of 4 worker threads
  dispatch::Dispatcher dispatcher{dispatch::DispatcherSettings{.threads = 4}};

  auto queue = dispatcher.CreateQueue("counter");

  static const size_t kIncrements = 100500;

  // Tasks of one queue are mutually exclusive,
  // non-atomic increment is fine here
  size_t count = 0;

  threads::blocking::WaitGroup wg;
  wg.Add(kIncrements);

  for (size_t i = 0; i < kIncrements; ++i) {
    executors::Submit(*queue, [&] {
      ++count;
      wg.Done();
    });
  }

  wg.Wait();

  fmt::print("Count: {}\n", count);
}

//////////////////////////////////////////////////////////////////////

void ReentrancyExample() {
  fmt::print("Reentrancy Example\n");

  executors::ManualExecutor manual;
  dispatch::Dispatcher dispatcher{manual};

  auto queue = dispatcher.CreateQueue("reentrant");

  // Submit from a task of the same queue runs in the same drain
  executors::Submit(*queue, [&] {
    fmt::print("Running on {}\n", dispatcher.CurrentQueue()->ToString());

    executors::Submit(*queue, [] {
      fmt::print("Nested task, same drain\n");
    });
  });

  size_t drains = manual.Drain();

  fmt::print("Drains: {}\n", drains);
}

//////////////////////////////////////////////////////////////////////

void SuspendExample() {
  fmt::print("Suspend Example\n");

  executors::ManualExecutor manual;
  dispatch::Dispatcher dispatcher{manual};

  auto queue = dispatcher.CreateQueue("suspended");

  queue->Suspend();

  executors::Submit(*queue, [] {
    fmt::print("Runs after Resume\n");
  });

  manual.Drain();
  fmt::print("Nothing ran while suspended\n");

  queue->Resume();
  manual.Drain();
}

//////////////////////////////////////////////////////////////////////

void HierarchyExample() {
  fmt::print("Hierarchy Example\n");

  dispatch::Dispatcher dispatcher{dispatch::DispatcherSettings{.threads = 4}};

  auto parent = dispatcher.CreateQueue("parent");
  auto child = parent->CreateQueue("child");

  threads::blocking::WaitGroup wg;
  wg.Add(1);

  // Child tasks run inside of the parent's drain
  executors::Submit(*child, [&] {
    fmt::print("{} executing: {}\n", parent->ToString(),
                 parent->IsExecuting());
    wg.Done();
  });

  wg.Wait();
}

//////////////////////////////////////////////////////////////////////

void DelayedExample() {
  fmt::print("Delayed Example\n");

  dispatch::Dispatcher dispatcher{dispatch::DispatcherSettings{.threads = 2}};

  auto queue = dispatcher.CreateQueue("delayed");

  threads::blocking::WaitGroup wg;
  wg.Add(1);

  queue->ExecuteAfter(100ms, [&] {
    fmt::print("Fired after 100ms\n");
    wg.Done();
  });

  wg.Wait();
}

//////////////////////////////////////////////////////////////////////

void MetricsExample() {
  fmt::print("Metrics Example\n");

  dispatch::Dispatcher dispatcher{dispatch::DispatcherSettings{.threads = 2}};

  auto queue = dispatcher.CreateQueue("profiled");
  queue->Profile(true);

  threads::blocking::WaitGroup wg;
  wg.Add(100);

  for (size_t i = 0; i < 100; ++i) {
    executors::Submit(*queue, [&] {
      wg.Done();
    });
  }

  wg.Wait();

  for (const auto& snapshot : dispatcher.Metrics()) {
    snapshot.Print();
  }
}

//////////////////////////////////////////////////////////////////////

int main() {
  SerialQueueExample();
  ReentrancyExample();
  SuspendExample();
  HierarchyExample();
  DelayedExample();
  MetricsExample();
  return 0;
}
