#include <tandem/metrics/collector.hpp>

namespace tandem::metrics {

class InactiveCollector : public IMetricsCollector {
 public:
  executors::Task* Track(executors::Task* task) override {
    return task;
  }

  std::optional<QueueMetrics> Snapshot() override {
    return std::nullopt;
  }
};

IMetricsCollector& Inactive() {
  static InactiveCollector instance;
  return instance;
}

}  // namespace tandem::metrics
