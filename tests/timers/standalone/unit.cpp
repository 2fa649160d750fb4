#include <tandem/threads/blocking/wait_group.hpp>

#include <tandem/timers/processors/standalone.hpp>

#include <wheels/test/framework.hpp>

#include <chrono>
#include <utility>

using namespace tandem;  // NOLINT
using namespace std::chrono_literals;

using tandem::threads::blocking::WaitGroup;
using tandem::timers::StandaloneProcessor;

TEST_SUITE(Standalone) {
  template <typename F>
  struct Tester : public timers::TimerBase {
    explicit Tester(timers::Millis ms, F&& f)
        : delay_(ms),
          fun_(std::move(f)) {
    }

    timers::Millis GetDelay() override {
      return delay_;
    }

    void Run() override {
      fun_();
    }

    void Discard() noexcept override {
      discarded_ = true;
    }

    timers::Millis delay_;
    F fun_;
    bool discarded_{false};
  };

  SIMPLE_TEST(JustWorks) {
    StandaloneProcessor proc;
    WaitGroup wg;
    wg.Add(1);

    Tester tester{5ms, [&] {
      wg.Done();
    }};

    proc.AddTimer(&tester);

    wg.Wait();
  }

  SIMPLE_TEST(CorrectDelay) {
    StandaloneProcessor proc;
    WaitGroup wg;
    wg.Add(1);

    Tester tester{300ms, [&wg] {
      wg.Done();
    }};

    auto start = std::chrono::steady_clock::now();

    proc.AddTimer(&tester);

    wg.Wait();

    auto elapsed = timers::ToMillis(std::chrono::steady_clock::now() - start);

    ASSERT_GE(elapsed, 300ms);
    ASSERT_LE(elapsed, 300ms + 100ms);
  }

  SIMPLE_TEST(Discard) {
    bool fired = false;

    Tester tester{10s, [&] {
      fired = true;
    }};

    {
      StandaloneProcessor proc;
      proc.AddTimer(&tester);

      ASSERT_EQ(proc.PendingCount(), 1);
    }

    ASSERT_FALSE(fired);
    ASSERT_TRUE(tester.discarded_);
  }

  SIMPLE_TEST(AddAfterStop) {
    Tester tester{1ms, [] {}};

    StandaloneProcessor proc;
    proc.Stop();

    proc.AddTimer(&tester);

    ASSERT_TRUE(tester.discarded_);
  }

  SIMPLE_TEST(DeadlineOrder) {
    int count = 0;
    bool first_fired = false;

    WaitGroup wg;
    wg.Add(1);

    Tester second{60ms, [&] {
      ASSERT_TRUE(first_fired);
      ++count;
      wg.Done();
    }};

    Tester first{20ms, [&] {
      first_fired = true;
      ++count;
    }};

    StandaloneProcessor proc;

    // Later deadline added first
    proc.AddTimer(&second);
    proc.AddTimer(&first);

    wg.Wait();

    ASSERT_EQ(count, 2);
  }
}

RUN_ALL_TESTS()
