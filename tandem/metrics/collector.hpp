#pragma once

#include <tandem/executors/task.hpp>

#include <tandem/metrics/metrics.hpp>

#include <optional>

namespace tandem::metrics {

// Transparent task decorator: must not change ordering, failures
// or enqueue decisions of the queue it is attached to

struct IMetricsCollector {
  virtual ~IMetricsCollector() = default;

  // Called once per submission, before the task is enqueued
  virtual executors::Task* Track(executors::Task* task) = 0;

  // Empty for collectors that measure nothing
  virtual std::optional<QueueMetrics> Snapshot() = 0;
};

// No-op collector shared by every non-profiled queue
IMetricsCollector& Inactive();

}  // namespace tandem::metrics
