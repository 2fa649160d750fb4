#pragma once

#include <stdexcept>
#include <string>

namespace tandem::dispatch {

// Queue hierarchy is not rooted in a dispatcher: fix the wiring

class NoTargetQueueError : public std::logic_error {
 public:
  explicit NoTargetQueueError(const std::string& queue)
      : std::logic_error(queue + " has no target queue") {
  }
};

}  // namespace tandem::dispatch
