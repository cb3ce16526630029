#include <catch2/catch.hpp>

#include "scheduler/model_slot_manager.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace modelgate;
using namespace std::chrono_literals;

namespace {

// Shared view of every backend a test factory has produced.
struct StubStats {
  std::atomic<int> created{0};
  std::atomic<int> loads{0};
  std::atomic<int> unloads{0};
  std::atomic<int> fail_next{0};
  std::chrono::milliseconds load_delay{0};
  std::chrono::milliseconds unload_delay{0};
};

class StubBackend : public InferenceBackend {
public:
  explicit StubBackend(StubStats *stats) : stats_(stats) {}

  bool Load(const ModelSpec &spec, std::string *error) override {
    if (stats_->load_delay.count() > 0)
      std::this_thread::sleep_for(stats_->load_delay);
    ++stats_->loads;
    int pending = stats_->fail_next.load();
    while (pending > 0 &&
           !stats_->fail_next.compare_exchange_weak(pending, pending - 1)) {
    }
    if (pending > 0) {
      *error = "stub refused " + spec.id;
      return false;
    }
    ready_ = true;
    return true;
  }
  void Unload() override {
    if (stats_->unload_delay.count() > 0)
      std::this_thread::sleep_for(stats_->unload_delay);
    ready_ = false;
    ++stats_->unloads;
  }
  bool IsReady() const override { return ready_; }
  nlohmann::json Invoke(const std::string &operation,
                        const nlohmann::json &) override {
    return {{"operation", operation}};
  }
  std::vector<std::string> Operations() const override { return {"echo"}; }
  std::string Name() const override { return "stub"; }

private:
  StubStats *stats_;
  bool ready_{false};
};

ModelSlotManager::BackendFactoryFn StubFactory(StubStats *stats) {
  return [stats](const ModelSpec &) -> std::unique_ptr<InferenceBackend> {
    ++stats->created;
    return std::make_unique<StubBackend>(stats);
  };
}

ModelSpec Model(const std::string &id, int64_t memory_mb, bool pinned = false,
                bool preload = false) {
  ModelSpec spec;
  spec.id = id;
  spec.kind = "embedding";
  spec.memory_mb = memory_mb;
  spec.pinned = pinned;
  spec.preload = preload;
  return spec;
}

SlotInfo Info(const ModelSlotManager &slots, const std::string &id) {
  for (const auto &info : slots.Snapshot()) {
    if (info.id == id)
      return info;
  }
  return {};
}

} // namespace

TEST_CASE("ModelSlotManager loads on first acquire and counts references",
          "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 50));
  StubStats stats;
  MetricsRegistry metrics;
  ModelSlotManager slots(catalog, 0, StubFactory(&stats), &metrics);

  {
    ModelHandle first;
    ModelHandle second;
    REQUIRE(slots.Acquire("embedding:a", &first).ok());
    REQUIRE(slots.Acquire("embedding:a", &second).ok());
    REQUIRE(first);
    REQUIRE(first.model_id() == "embedding:a");
    REQUIRE(first->Name() == "stub");
    REQUIRE(first.backend() == second.backend());

    auto info = Info(slots, "embedding:a");
    REQUIRE(info.state == SlotState::kReady);
    REQUIRE(info.refcount == 2);
    REQUIRE(info.loads == 1);
    REQUIRE(slots.ReservedMb() == 50);
  }
  REQUIRE(Info(slots, "embedding:a").refcount == 0);
  REQUIRE(stats.created == 1);
  REQUIRE(metrics.ModelLoadCount("embedding:a") == 1);
}

TEST_CASE("ModelSlotManager reports unknown models", "[slots]") {
  ModelCatalog catalog;
  StubStats stats;
  ModelSlotManager slots(catalog, 0, StubFactory(&stats));
  ModelHandle handle;
  auto err = slots.Acquire("embedding:ghost", &handle);
  REQUIRE(err.kind == ErrorKind::kModelUnavailable);
  REQUIRE(err.code == "unknown_model");
  REQUIRE(slots.Unload("embedding:ghost").kind == ErrorKind::kNotFound);
}

TEST_CASE("ModelSlotManager runs a single load for concurrent callers",
          "[slots][stress]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 10));
  StubStats stats;
  stats.load_delay = 50ms;
  ModelSlotManager slots(catalog, 0, StubFactory(&stats));

  constexpr int kThreads = 16;
  std::atomic<int> acquired{0};
  std::atomic<int> peak_refs{0};
  std::atomic<int> holding{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      ModelHandle handle;
      if (!slots.Acquire("embedding:a", &handle).ok())
        return;
      ++acquired;
      int now = ++holding;
      int prev = peak_refs.load();
      while (now > prev && !peak_refs.compare_exchange_weak(prev, now)) {
      }
      std::this_thread::sleep_for(5ms);
      --holding;
    });
  }
  for (auto &t : threads)
    t.join();

  REQUIRE(acquired == kThreads);
  REQUIRE(stats.created == 1);
  REQUIRE(stats.loads == 1);
  REQUIRE(peak_refs >= 1);
  auto info = Info(slots, "embedding:a");
  REQUIRE(info.loads == 1);
  REQUIRE(info.refcount == 0);
}

TEST_CASE("ModelSlotManager evicts the least recently used idle model",
          "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 50));
  catalog.Add(Model("embedding:b", 50));
  catalog.Add(Model("embedding:c", 50));
  StubStats stats;
  MetricsRegistry metrics;
  ModelSlotManager slots(catalog, 100, StubFactory(&stats), &metrics);

  REQUIRE(slots.Load("embedding:a").ok());
  std::this_thread::sleep_for(5ms);
  REQUIRE(slots.Load("embedding:b").ok());
  std::this_thread::sleep_for(5ms);
  {
    // Touch a so that b becomes the oldest.
    ModelHandle touch;
    REQUIRE(slots.Acquire("embedding:a", &touch).ok());
  }
  std::this_thread::sleep_for(5ms);

  REQUIRE(slots.Load("embedding:c").ok());
  REQUIRE(Info(slots, "embedding:a").state == SlotState::kReady);
  auto evicted = Info(slots, "embedding:b");
  REQUIRE(evicted.state == SlotState::kUnloaded);
  REQUIRE(evicted.evictions == 1);
  REQUIRE(Info(slots, "embedding:c").state == SlotState::kReady);
  REQUIRE(slots.ReservedMb() == 100);
  REQUIRE(stats.unloads == 1);
  REQUIRE(metrics.EvictionCount("embedding:b") == 1);
}

TEST_CASE("ModelSlotManager never evicts models in use", "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 60));
  catalog.Add(Model("embedding:b", 60));
  StubStats stats;
  ModelSlotManager slots(catalog, 100, StubFactory(&stats));

  ModelHandle held;
  REQUIRE(slots.Acquire("embedding:a", &held).ok());

  ModelHandle other;
  auto err = slots.Acquire("embedding:b", &other);
  REQUIRE(err.kind == ErrorKind::kModelUnavailable);
  REQUIRE(err.code == "resource_exhausted");
  REQUIRE_FALSE(other);
  REQUIRE(slots.ReservedMb() == 60);
  REQUIRE(Info(slots, "embedding:a").state == SlotState::kReady);

  held.Release();
  REQUIRE(slots.Acquire("embedding:b", &other).ok());
  REQUIRE(Info(slots, "embedding:a").state == SlotState::kUnloaded);
}

TEST_CASE("ModelSlotManager never evicts pinned models", "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:pinned", 60, true));
  catalog.Add(Model("embedding:b", 60));
  StubStats stats;
  ModelSlotManager slots(catalog, 100, StubFactory(&stats));

  REQUIRE(slots.Preload() == 0);
  REQUIRE(Info(slots, "embedding:pinned").state == SlotState::kReady);
  REQUIRE(Info(slots, "embedding:pinned").refcount == 0);

  auto err = slots.Load("embedding:b");
  REQUIRE(err.code == "resource_exhausted");
  REQUIRE(Info(slots, "embedding:pinned").state == SlotState::kReady);
}

TEST_CASE("ModelSlotManager retries after a failed load", "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 40));
  StubStats stats;
  stats.fail_next = 1;
  MetricsRegistry metrics;
  ModelSlotManager slots(catalog, 100, StubFactory(&stats), &metrics);

  ModelHandle handle;
  auto err = slots.Acquire("embedding:a", &handle);
  REQUIRE(err.kind == ErrorKind::kModelUnavailable);
  REQUIRE(err.code == "load_failed");
  REQUIRE_FALSE(handle);
  auto failed = Info(slots, "embedding:a");
  REQUIRE(failed.state == SlotState::kFailed);
  REQUIRE(failed.load_failures == 1);
  REQUIRE_FALSE(failed.last_error.empty());
  REQUIRE(slots.ReservedMb() == 0);

  REQUIRE(slots.Acquire("embedding:a", &handle).ok());
  auto ready = Info(slots, "embedding:a");
  REQUIRE(ready.state == SlotState::kReady);
  REQUIRE(ready.last_error.empty());
  REQUIRE(slots.ReservedMb() == 40);
  REQUIRE(stats.created == 2);
}

TEST_CASE("ModelSlotManager reports a factory without a backend", "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 10));
  ModelSlotManager slots(catalog, 0, [](const ModelSpec &) {
    return std::unique_ptr<InferenceBackend>();
  });
  auto err = slots.Load("embedding:a");
  REQUIRE(err.code == "load_failed");
  REQUIRE(Info(slots, "embedding:a").last_error.find("failed to load") !=
          std::string::npos);
}

TEST_CASE("ModelSlotManager times out waiting on another load", "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:slow", 10));
  StubStats stats;
  stats.load_delay = 300ms;
  ModelSlotManager slots(catalog, 0, StubFactory(&stats));

  std::atomic<bool> loader_ok{false};
  std::thread loader([&] { loader_ok = slots.Load("embedding:slow").ok(); });

  auto deadline = std::chrono::steady_clock::now() + 2000ms;
  while (Info(slots, "embedding:slow").state != SlotState::kLoading &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  REQUIRE(Info(slots, "embedding:slow").state == SlotState::kLoading);

  ModelHandle handle;
  auto err = slots.Acquire("embedding:slow", &handle,
                           std::chrono::steady_clock::now() + 20ms);
  REQUIRE(err.kind == ErrorKind::kTimeout);
  REQUIRE(err.code == "model_load_timeout");

  loader.join();
  REQUIRE(loader_ok);
  REQUIRE(stats.loads == 1);
}

TEST_CASE("ModelSlotManager unloads only idle models", "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 30));
  StubStats stats;
  ModelSlotManager slots(catalog, 0, StubFactory(&stats));

  // Unloading something that is not loaded is a no-op.
  REQUIRE(slots.Unload("embedding:a").ok());

  ModelHandle handle;
  REQUIRE(slots.Acquire("embedding:a", &handle).ok());
  auto busy = slots.Unload("embedding:a");
  REQUIRE(busy.kind == ErrorKind::kModelUnavailable);
  REQUIRE(busy.code == "model_busy");

  handle.Release();
  REQUIRE(slots.Unload("embedding:a").ok());
  REQUIRE(Info(slots, "embedding:a").state == SlotState::kUnloaded);
  REQUIRE(Info(slots, "embedding:a").evictions == 0);
  REQUIRE(slots.ReservedMb() == 0);
  REQUIRE(stats.unloads == 1);
}

TEST_CASE("ModelSlotManager preloads marked models and counts failures",
          "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:eager", 10, false, true));
  catalog.Add(Model("embedding:lazy", 10));
  StubStats stats;
  ModelSlotManager slots(catalog, 0, StubFactory(&stats));

  REQUIRE(slots.Preload() == 0);
  REQUIRE(Info(slots, "embedding:eager").state == SlotState::kReady);
  REQUIRE(Info(slots, "embedding:lazy").state == SlotState::kUnloaded);

  slots.Shutdown();
  REQUIRE(Info(slots, "embedding:eager").state == SlotState::kUnloaded);

  stats.fail_next = 1;
  REQUIRE(slots.Preload() == 1);
}

TEST_CASE("ModelHandle moves keep a single reference", "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 10));
  StubStats stats;
  ModelSlotManager slots(catalog, 0, StubFactory(&stats));

  ModelHandle first;
  REQUIRE(slots.Acquire("embedding:a", &first).ok());
  ModelHandle moved(std::move(first));
  REQUIRE_FALSE(first);
  REQUIRE(moved);
  REQUIRE(Info(slots, "embedding:a").refcount == 1);

  // Re-acquiring into a live handle drops its old reference.
  REQUIRE(slots.Acquire("embedding:a", &moved).ok());
  REQUIRE(Info(slots, "embedding:a").refcount == 1);
  moved.Release();
  REQUIRE(Info(slots, "embedding:a").refcount == 0);
}

TEST_CASE("ModelSlotManager frees budget before a model reads as unloaded",
          "[slots]") {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", 40));
  StubStats stats;
  stats.unload_delay = 50ms;
  ModelSlotManager slots(catalog, 40, StubFactory(&stats));
  REQUIRE(slots.Load("embedding:a").ok());

  std::atomic<bool> unload_ok{false};
  std::thread unloader([&] { unload_ok = slots.Unload("embedding:a").ok(); });

  auto deadline = std::chrono::steady_clock::now() + 2000ms;
  while (Info(slots, "embedding:a").state != SlotState::kUnloading &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  REQUIRE(Info(slots, "embedding:a").state == SlotState::kUnloading);

  // Waits out the unload, then reloads into the budget it just returned.
  ModelHandle handle;
  auto err = slots.Acquire("embedding:a", &handle);
  unloader.join();
  REQUIRE(unload_ok);
  REQUIRE(err.ok());
  REQUIRE(handle);
  REQUIRE(slots.ReservedMb() == 40);
  REQUIRE(stats.loads == 2);
}

TEST_CASE("ModelSlotManager keeps the budget under concurrent churn",
          "[slots]") {
  const std::vector<std::string> ids = {"embedding:a", "embedding:b",
                                        "embedding:c", "embedding:d"};
  const int64_t kFootprint = 40;
  const int64_t kBudget = 100; // fits two of the four models
  ModelCatalog catalog;
  for (const auto &id : ids)
    catalog.Add(Model(id, kFootprint));
  StubStats stats;
  MetricsRegistry metrics;
  ModelSlotManager slots(catalog, kBudget, StubFactory(&stats), &metrics);

  std::atomic<int> over_budget{0};
  std::atomic<int> bad_handles{0};
  std::atomic<int> unexpected_errors{0};
  std::atomic<int> served{0};
  std::atomic<bool> stop{false};

  auto check_budget = [&] {
    if (slots.ReservedMb() > kBudget)
      ++over_budget;
  };

  std::vector<std::thread> workers;
  for (int t = 0; t < 6; ++t) {
    workers.emplace_back([&, t] {
      std::mt19937 rng(1234 + t);
      std::uniform_int_distribution<size_t> pick(0, ids.size() - 1);
      for (int i = 0; i < 300; ++i) {
        const std::string &id = ids[pick(rng)];
        ModelHandle handle;
        auto err = slots.Acquire(id, &handle);
        check_budget();
        if (err) {
          if (err.code != "resource_exhausted")
            ++unexpected_errors;
          continue;
        }
        auto held = Info(slots, id);
        if (!handle || held.state != SlotState::kReady || held.refcount < 1)
          ++bad_handles;
        if (i % 7 == 0)
          std::this_thread::sleep_for(100us);
        handle.Release();
        check_budget();
        ++served;
      }
    });
  }
  std::thread unloader([&] {
    size_t next = 0;
    while (!stop) {
      auto err = slots.Unload(ids[next++ % ids.size()]);
      if (err && err.code != "model_busy")
        ++unexpected_errors;
      check_budget();
      std::this_thread::sleep_for(200us);
    }
  });

  for (auto &worker : workers)
    worker.join();
  stop = true;
  unloader.join();

  REQUIRE(over_budget == 0);
  REQUIRE(bad_handles == 0);
  REQUIRE(unexpected_errors == 0);
  REQUIRE(served > 0);

  int ready = 0;
  for (const auto &info : slots.Snapshot()) {
    REQUIRE(info.refcount == 0);
    REQUIRE(info.state != SlotState::kLoading);
    REQUIRE(info.state != SlotState::kUnloading);
    if (info.state == SlotState::kReady)
      ++ready;
  }
  REQUIRE(slots.ReservedMb() == ready * kFootprint);
  REQUIRE(slots.ReservedMb() <= kBudget);
  REQUIRE(stats.loads - stats.unloads == ready);
}
