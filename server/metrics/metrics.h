#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace modelgate {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000,
  // 10000, 30000, +Inf. Model loads and admission waits reach the high end.
  static constexpr std::array<double, 10> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0, 10000.0, 30000.0};
  std::array<std::atomic<uint64_t>, 11> counts{}; // 10 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  // One finished HTTP request. `route` is the route template, never a raw
  // path, so label cardinality stays bounded.
  void RecordRequest(const std::string &route, int status, double latency_ms);
  // Requests refused before reaching a model, by error type name.
  void RecordDenial(const std::string &kind);

  void RecordModelLoad(const std::string &model_id, double load_ms, bool success);
  void RecordModelEviction(const std::string &model_id);
  void RecordModelReady(const std::string &model_id, bool ready);
  void SetMemoryReserved(int64_t reserved_mb, int64_t budget_mb);

  void RecordAdmissionWait(double wait_ms);
  void RecordAdmissionTimeout(const std::string &model_id);
  void RecordAdmissionRejected(const std::string &model_id);
  void SetQueueDepth(const std::string &model_id, int depth);

  void RecordBackendError(const std::string &model_id);

  // Active connection gauge.
  void IncrementConnections();
  void DecrementConnections();

  uint64_t RequestCount(const std::string &route, int status) const;
  uint64_t DenialCount(const std::string &kind) const;
  uint64_t ModelLoadCount(const std::string &model_id) const;
  uint64_t EvictionCount(const std::string &model_id) const;

  std::string RenderPrometheus() const;

private:
  struct ModelStats {
    uint64_t loads{0};
    uint64_t load_failures{0};
    uint64_t evictions{0};
    uint64_t admission_timeouts{0};
    uint64_t admission_rejections{0};
    uint64_t backend_errors{0};
    int queue_depth{0};
    bool ready{false};
  };

  mutable std::mutex requests_mutex_;
  std::map<std::pair<std::string, int>, uint64_t> requests_; // (route, status)
  std::map<std::string, uint64_t> denials_;

  mutable std::mutex model_metrics_mutex_;
  std::map<std::string, ModelStats> model_stats_;

  LatencyHistogram request_latency_;
  LatencyHistogram load_latency_;
  LatencyHistogram admission_wait_;

  std::atomic<int> active_connections_{0};
  std::atomic<int64_t> memory_reserved_mb_{0};
  std::atomic<int64_t> memory_budget_mb_{0};
};

MetricsRegistry &GlobalMetrics();

} // namespace modelgate
