#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace modelgate {

namespace {
MetricsRegistry g_metrics;

void RenderHistogram(std::ostringstream &out, const std::string &name,
                     const std::string &help, const LatencyHistogram &hist) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} " << hist.counts[i].load()
        << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} "
      << hist.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum " << hist.sum_ms.load() << "\n";
  out << name << "_count " << hist.total.load() << "\n";
}

void Header(std::ostringstream &out, const char *name, const char *help,
            const char *type) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " " << type << "\n";
}
}  // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  // +Inf bucket always increments.
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordRequest(const std::string& route, int status,
                                    double latency_ms) {
  request_latency_.Record(latency_ms);
  std::lock_guard<std::mutex> lock(requests_mutex_);
  requests_[{route, status}] += 1;
}

void MetricsRegistry::RecordDenial(const std::string& kind) {
  std::lock_guard<std::mutex> lock(requests_mutex_);
  denials_[kind] += 1;
}

void MetricsRegistry::RecordModelLoad(const std::string& model_id, double load_ms,
                                      bool success) {
  if (success) {
    load_latency_.Record(load_ms);
  }
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  auto& stats = model_stats_[model_id];
  if (success) {
    stats.loads += 1;
  } else {
    stats.load_failures += 1;
  }
}

void MetricsRegistry::RecordModelEviction(const std::string& model_id) {
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  model_stats_[model_id].evictions += 1;
}

void MetricsRegistry::RecordModelReady(const std::string& model_id, bool ready) {
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  model_stats_[model_id].ready = ready;
}

void MetricsRegistry::SetMemoryReserved(int64_t reserved_mb, int64_t budget_mb) {
  memory_reserved_mb_.store(reserved_mb, std::memory_order_relaxed);
  memory_budget_mb_.store(budget_mb, std::memory_order_relaxed);
}

void MetricsRegistry::RecordAdmissionWait(double wait_ms) {
  admission_wait_.Record(wait_ms);
}

void MetricsRegistry::RecordAdmissionTimeout(const std::string& model_id) {
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  model_stats_[model_id].admission_timeouts += 1;
}

void MetricsRegistry::RecordAdmissionRejected(const std::string& model_id) {
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  model_stats_[model_id].admission_rejections += 1;
}

void MetricsRegistry::SetQueueDepth(const std::string& model_id, int depth) {
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  model_stats_[model_id].queue_depth = depth;
}

void MetricsRegistry::RecordBackendError(const std::string& model_id) {
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  model_stats_[model_id].backend_errors += 1;
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

uint64_t MetricsRegistry::RequestCount(const std::string& route, int status) const {
  std::lock_guard<std::mutex> lock(requests_mutex_);
  auto it = requests_.find({route, status});
  return it == requests_.end() ? 0 : it->second;
}

uint64_t MetricsRegistry::DenialCount(const std::string& kind) const {
  std::lock_guard<std::mutex> lock(requests_mutex_);
  auto it = denials_.find(kind);
  return it == denials_.end() ? 0 : it->second;
}

uint64_t MetricsRegistry::ModelLoadCount(const std::string& model_id) const {
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  auto it = model_stats_.find(model_id);
  return it == model_stats_.end() ? 0 : it->second.loads;
}

uint64_t MetricsRegistry::EvictionCount(const std::string& model_id) const {
  std::lock_guard<std::mutex> lock(model_metrics_mutex_);
  auto it = model_stats_.find(model_id);
  return it == model_stats_.end() ? 0 : it->second.evictions;
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  // --- Requests ---
  {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    Header(out, "modelgate_requests_total", "HTTP requests by route and status", "counter");
    for (const auto& [key, count] : requests_) {
      out << "modelgate_requests_total{route=\"" << key.first << "\",status=\""
          << key.second << "\"} " << count << "\n";
    }
    Header(out, "modelgate_denials_total", "Requests refused, by error type", "counter");
    for (const auto& [kind, count] : denials_) {
      out << "modelgate_denials_total{type=\"" << kind << "\"} " << count << "\n";
    }
  }
  RenderHistogram(out, "modelgate_request_duration_ms",
                  "Request end-to-end latency in milliseconds", request_latency_);

  // --- Models ---
  {
    std::lock_guard<std::mutex> lock(model_metrics_mutex_);
    Header(out, "modelgate_model_loads_total", "Successful model loads", "counter");
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_model_loads_total{model=\"" << model << "\"} " << stats.loads << "\n";
    }
    Header(out, "modelgate_model_load_failures_total", "Failed model loads", "counter");
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_model_load_failures_total{model=\"" << model << "\"} "
          << stats.load_failures << "\n";
    }
    Header(out, "modelgate_model_evictions_total", "Models unloaded to free budget", "counter");
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_model_evictions_total{model=\"" << model << "\"} " << stats.evictions
          << "\n";
    }
    Header(out, "modelgate_model_ready", "Model readiness (1=ready)", "gauge");
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_model_ready{model=\"" << model << "\"} " << (stats.ready ? 1 : 0)
          << "\n";
    }
    Header(out, "modelgate_admission_timeouts_total",
           "Requests that timed out waiting for an execution slot", "counter");
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_admission_timeouts_total{model=\"" << model << "\"} "
          << stats.admission_timeouts << "\n";
    }
    Header(out, "modelgate_admission_rejections_total",
           "Requests rejected because the admission queue was full", "counter");
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_admission_rejections_total{model=\"" << model << "\"} "
          << stats.admission_rejections << "\n";
    }
    Header(out, "modelgate_admission_queue_depth", "Requests waiting for an execution slot",
           "gauge");
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_admission_queue_depth{model=\"" << model << "\"} "
          << stats.queue_depth << "\n";
    }
    Header(out, "modelgate_backend_errors_total", "Backend invocation failures", "counter");
    for (const auto& [model, stats] : model_stats_) {
      out << "modelgate_backend_errors_total{model=\"" << model << "\"} "
          << stats.backend_errors << "\n";
    }
  }
  RenderHistogram(out, "modelgate_model_load_duration_ms", "Model load time in milliseconds",
                  load_latency_);
  RenderHistogram(out, "modelgate_admission_wait_duration_ms",
                  "Time requests wait for an execution slot", admission_wait_);

  // --- Gauges ---
  Header(out, "modelgate_memory_reserved_mb", "Estimated memory held by loaded models", "gauge");
  out << "modelgate_memory_reserved_mb " << memory_reserved_mb_.load() << "\n";
  Header(out, "modelgate_memory_budget_mb", "Configured model memory budget (0=unlimited)",
         "gauge");
  out << "modelgate_memory_budget_mb " << memory_budget_mb_.load() << "\n";
  Header(out, "modelgate_active_connections", "Current number of active HTTP connections",
         "gauge");
  out << "modelgate_active_connections " << active_connections_.load() << "\n";

  return out.str();
}

MetricsRegistry& GlobalMetrics() { return g_metrics; }

}  // namespace modelgate
