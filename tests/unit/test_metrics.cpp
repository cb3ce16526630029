#include <catch2/catch.hpp>

#include "server/metrics/metrics.h"

#include <string>
#include <thread>
#include <vector>

using namespace modelgate;

namespace {

bool Contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("LatencyHistogram buckets are cumulative", "[metrics]") {
  LatencyHistogram hist;
  hist.Record(5);
  hist.Record(75);
  hist.Record(60000);
  REQUIRE(hist.total.load() == 3);
  REQUIRE(hist.sum_ms.load() == 60080);
  REQUIRE(hist.counts[0].load() == 1);  // <= 10
  REQUIRE(hist.counts[2].load() == 2);  // <= 100
  REQUIRE(hist.counts[9].load() == 2);  // <= 30000
  REQUIRE(hist.counts[10].load() == 3); // +Inf
}

TEST_CASE("MetricsRegistry counts requests by route and status", "[metrics]") {
  MetricsRegistry metrics;
  metrics.RecordRequest("/embeddings", 200, 12);
  metrics.RecordRequest("/embeddings", 200, 8);
  metrics.RecordRequest("/embeddings", 429, 1);
  metrics.RecordDenial("rate_limit_exceeded");

  REQUIRE(metrics.RequestCount("/embeddings", 200) == 2);
  REQUIRE(metrics.RequestCount("/embeddings", 429) == 1);
  REQUIRE(metrics.RequestCount("/transcribe", 200) == 0);
  REQUIRE(metrics.DenialCount("rate_limit_exceeded") == 1);

  auto text = metrics.RenderPrometheus();
  REQUIRE(Contains(text, "# TYPE modelgate_requests_total counter"));
  REQUIRE(Contains(text, "modelgate_requests_total{route=\"/embeddings\",status=\"200\"} 2"));
  REQUIRE(Contains(text, "modelgate_denials_total{type=\"rate_limit_exceeded\"} 1"));
  REQUIRE(Contains(text, "modelgate_request_duration_ms_count 3"));
  REQUIRE(Contains(text, "modelgate_request_duration_ms_bucket{le=\"10\"} 2"));
}

TEST_CASE("MetricsRegistry tracks model lifecycle", "[metrics]") {
  MetricsRegistry metrics;
  metrics.RecordModelLoad("embedding:small", 120, true);
  metrics.RecordModelLoad("embedding:small", 0, false);
  metrics.RecordModelReady("embedding:small", true);
  metrics.RecordModelEviction("embedding:small");
  metrics.RecordAdmissionTimeout("llm:mistral");
  metrics.RecordAdmissionRejected("llm:mistral");
  metrics.SetQueueDepth("llm:mistral", 3);
  metrics.RecordBackendError("llm:mistral");
  metrics.SetMemoryReserved(512, 2048);

  REQUIRE(metrics.ModelLoadCount("embedding:small") == 1);
  REQUIRE(metrics.EvictionCount("embedding:small") == 1);
  REQUIRE(metrics.ModelLoadCount("llm:mistral") == 0);

  auto text = metrics.RenderPrometheus();
  REQUIRE(Contains(text, "modelgate_model_loads_total{model=\"embedding:small\"} 1"));
  REQUIRE(Contains(text, "modelgate_model_load_failures_total{model=\"embedding:small\"} 1"));
  REQUIRE(Contains(text, "modelgate_model_ready{model=\"embedding:small\"} 1"));
  REQUIRE(Contains(text, "modelgate_admission_timeouts_total{model=\"llm:mistral\"} 1"));
  REQUIRE(Contains(text, "modelgate_admission_rejections_total{model=\"llm:mistral\"} 1"));
  REQUIRE(Contains(text, "modelgate_admission_queue_depth{model=\"llm:mistral\"} 3"));
  REQUIRE(Contains(text, "modelgate_backend_errors_total{model=\"llm:mistral\"} 1"));
  REQUIRE(Contains(text, "modelgate_memory_reserved_mb 512"));
  REQUIRE(Contains(text, "modelgate_memory_budget_mb 2048"));
  REQUIRE(Contains(text, "modelgate_model_load_duration_ms_count 1"));
}

TEST_CASE("MetricsRegistry connection gauge", "[metrics]") {
  MetricsRegistry metrics;
  metrics.IncrementConnections();
  metrics.IncrementConnections();
  metrics.DecrementConnections();
  REQUIRE(Contains(metrics.RenderPrometheus(), "modelgate_active_connections 1"));
}

TEST_CASE("MetricsRegistry is safe under concurrent updates", "[metrics]") {
  MetricsRegistry metrics;
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&metrics] {
      for (int i = 0; i < 500; ++i) {
        metrics.RecordRequest("/business/sentiment", 200, 3);
        metrics.RecordAdmissionWait(1);
      }
    });
  }
  for (auto &th : threads) {
    th.join();
  }
  REQUIRE(metrics.RequestCount("/business/sentiment", 200) == 4000);
  REQUIRE(Contains(metrics.RenderPrometheus(),
                   "modelgate_admission_wait_duration_ms_count 4000"));
}
