#include <tandem/satellite/satellite.hpp>

#include <tandem/dispatch/queue.hpp>

#include <twist/ed/local/ptr.hpp>
#include <twist/ed/stdlike/atomic.hpp>

#include <fmt/core.h>

#include <cstdio>
#include <exception>
#include <utility>

namespace tandem::satellite {

//////////////////////////////////////////////////////////////////////

namespace {

class LoggingSink : public IFailureSink {
 public:
  void OnTaskFailure(dispatch::IQueue& queue,
                     std::exception_ptr failure) noexcept override {
    try {
      std::rethrow_exception(failure);
    } catch (const std::exception& e) {
      fmt::print(stderr, "Task failed on {}: {}\n", queue.ToString(),
                 e.what());
    } catch (...) {
      fmt::print(stderr, "Task failed on {}: unknown exception\n",
                 queue.ToString());
    }
  }
};

LoggingSink default_sink;

}  // namespace

static twist::ed::ThreadLocalPtr<dispatch::IQueue> current_queue;

static twist::ed::stdlike::atomic<IFailureSink*> failure_sink{&default_sink};

//////////////////////////////////////////////////////////////////////

dispatch::IQueue* CurrentQueue() {
  return current_queue;
}

dispatch::IQueue* SetCurrentQueue(dispatch::IQueue* queue) {
  dispatch::IQueue* prev = current_queue;
  current_queue = queue;
  return prev;
}

IFailureSink* SetFailureSink(IFailureSink* sink) {
  if (sink == nullptr) {
    sink = &default_sink;
  }
  return failure_sink.exchange(sink, std::memory_order::acq_rel);
}

void ReportFailure(dispatch::IQueue& queue, std::exception_ptr failure) {
  failure_sink.load(std::memory_order::acquire)
      ->OnTaskFailure(queue, std::move(failure));
}

}  // namespace tandem::satellite
