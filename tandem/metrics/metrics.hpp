#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace tandem::metrics {

using Nanos = std::chrono::nanoseconds;

// Activity of one queue over an interval between two snapshots

struct QueueMetrics {
  std::string label;

  // Length of the covered interval
  Nanos duration{0};

  // Tasks submitted / started during the interval
  uint64_t enqueued{0};
  uint64_t dequeued{0};

  // Submission -> start
  Nanos max_wait_time{0};
  Nanos total_wait_time{0};

  // Start -> completion
  Nanos max_run_time{0};
  Nanos total_run_time{0};

  void Print() const;
};

}  // namespace tandem::metrics
