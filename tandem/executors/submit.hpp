#pragma once

#include <tandem/executors/executor.hpp>

#include <function2/function2.hpp>

#include <wheels/core/defer.hpp>

#include <utility>

namespace tandem::executors {

using Function = fu2::unique_function<void()>;

namespace detail {

// Heap-allocated task, destroys itself after Run (even if fun throws)

class FunctionTask : public Task {
 public:
  explicit FunctionTask(Function fun)
      : fun_(std::move(fun)) {
  }

  void Run() override {
    wheels::Defer cleanup([this] {
      delete this;
    });

    fun_();
  }

 private:
  Function fun_;
};

}  // namespace detail

inline Task* MakeTask(Function fun) {
  return new detail::FunctionTask(std::move(fun));
}

/*
 * Usage:
 *
 * Submit(queue, [] {
 *   fmt::print("Running on queue\n");
 * });
 *
 */

template <typename F>
void Submit(IExecutor& exe, F fun) {
  exe.Submit(MakeTask(Function(std::move(fun))));
}

}  // namespace tandem::executors
