#include <tandem/metrics/metrics.hpp>

#include <fmt/core.h>

namespace tandem::metrics {

void QueueMetrics::Print() const {
  fmt::print("{}: duration {}ns\n", label, duration.count());
  fmt::print("  enqueued: {}, dequeued: {}\n", enqueued, dequeued);
  fmt::print("  wait time: max {}ns, total {}ns\n", max_wait_time.count(),
               total_wait_time.count());
  fmt::print("  run time: max {}ns, total {}ns\n", max_run_time.count(),
               total_run_time.count());
}

}  // namespace tandem::metrics
