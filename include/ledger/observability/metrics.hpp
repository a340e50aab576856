#ifndef LEDGER_METRICS_HPP_
#define LEDGER_METRICS_HPP_

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace observability {

// Metric names shared by the storage components
namespace metric {
inline constexpr const char* kActivityAppends = "ledger_activity_appends_total";
inline constexpr const char* kActivityAppendFailures = "ledger_activity_append_failures_total";
inline constexpr const char* kSnapshotSaves = "ledger_snapshot_saves_total";
inline constexpr const char* kSnapshotSaveFailures = "ledger_snapshot_save_failures_total";
inline constexpr const char* kSnapshotSaveSeconds = "ledger_snapshot_save_seconds";
inline constexpr const char* kSnapshotLoadFallbacks = "ledger_snapshot_load_fallbacks_total";
inline constexpr const char* kReplayRowsApplied = "ledger_replay_rows_applied_total";
inline constexpr const char* kReplayRowsSkipped = "ledger_replay_rows_skipped_total";
inline constexpr const char* kIdAllocations = "ledger_id_allocations_total";
inline constexpr const char* kIdCollisions = "ledger_id_collisions_total";
inline constexpr const char* kAccountsLoaded = "ledger_accounts_loaded";
inline constexpr const char* kCustomersLoaded = "ledger_customers_loaded";
}  // namespace metric

/**
 * Metrics collection for the ledger store.
 * Supports counters, gauges, and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);
  double counterValue(const std::string& name) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);
  size_t histogramCount(const std::string& name) const;

  // Records elapsed seconds into a histogram on destruction
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus text format
  std::string exportMetrics() const;

  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Process-wide metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_METRICS_HPP_
