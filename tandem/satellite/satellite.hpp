#pragma once

#include <exception>

// bunch of fwds

namespace tandem::dispatch {
struct IQueue;
}  // namespace tandem::dispatch

namespace tandem::satellite {

// Current queue

// Queue whose drain is running on this thread, nullptr outside of drains
dispatch::IQueue* CurrentQueue();

// Returns the previous value
dispatch::IQueue* SetCurrentQueue(dispatch::IQueue*);

// Task failures

struct IFailureSink {
  virtual ~IFailureSink() = default;

  // Invoked on the draining thread, must not throw
  virtual void OnTaskFailure(dispatch::IQueue& queue,
                             std::exception_ptr failure) noexcept = 0;
};

// nullptr restores the default sink (log to stderr)
// Returns the previous sink
IFailureSink* SetFailureSink(IFailureSink*);

void ReportFailure(dispatch::IQueue&, std::exception_ptr);

}  // namespace tandem::satellite
