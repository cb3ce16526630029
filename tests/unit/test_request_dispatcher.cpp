#include <catch2/catch.hpp>

#include "scheduler/request_dispatcher.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace modelgate;
using namespace std::chrono_literals;

namespace {

const std::string kRawKey = "mg_dispatcher_test_key_0001";
const std::string kUrgentKey = "mg_urgentkey_dispatch_0002";

// Backend whose Invoke behavior is chosen by the operation name.
class ScriptedBackend : public InferenceBackend {
public:
  explicit ScriptedBackend(std::function<void(const nlohmann::json &)> on_invoke)
      : on_invoke_(std::move(on_invoke)) {}

  bool Load(const ModelSpec &, std::string *) override { return true; }
  void Unload() override {}
  bool IsReady() const override { return true; }
  nlohmann::json Invoke(const std::string &operation,
                        const nlohmann::json &input) override {
    if (on_invoke_)
      on_invoke_(input);
    if (operation == "bad_input")
      throw std::invalid_argument("texts must be a list");
    if (operation == "crash")
      throw std::runtime_error("engine fault");
    return {{"echo", input}};
  }
  std::vector<std::string> Operations() const override {
    return {"echo", "bad_input", "crash"};
  }
  std::string Name() const override { return "scripted"; }

private:
  std::function<void(const nlohmann::json &)> on_invoke_;
};

ModelSpec Model(const std::string &id, const std::string &kind) {
  ModelSpec spec;
  spec.id = id;
  spec.kind = kind;
  spec.memory_mb = 10;
  return spec;
}

ModelCatalog TestCatalog() {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:a", "embedding"));
  auto limited = Model("sentiment:a", "sentiment");
  limited.max_concurrency = 1;
  limited.max_queue = 2;
  catalog.Add(limited);
  return catalog;
}

struct Pipeline {
  explicit Pipeline(std::chrono::milliseconds timeout = 2000ms,
                    bool priority_ordering = false)
      : catalog(TestCatalog()),
        slots(catalog, 0,
              [this](const ModelSpec &) -> std::unique_ptr<InferenceBackend> {
                ++backends_created;
                return std::make_unique<ScriptedBackend>(
                    [this](const nlohmann::json &input) {
                      in_flight_during_invoke =
                          admission.Stats("embedding:a").in_flight;
                      std::lock_guard<std::mutex> lock(order_mutex);
                      invoked_by.push_back(input.value("caller", ""));
                    });
              },
              &metrics),
        admission({4, 0}, priority_ordering, &metrics),
        dispatcher(keys, limiter, catalog, slots, admission, timeout,
                   &metrics) {
    keys.AddStaticKey(kRawKey, "tests", {Capability::kEmbed, Capability::kBusiness},
                      {3, 60});
    keys.AddStaticKey(kUrgentKey, "urgent", {Capability::kBusiness}, {0, 60}, 5);
  }

  // The request path of one model-backed endpoint.
  GatewayError Run(const std::string &raw_key, Capability capability,
                   const std::string &task, const std::string &requested,
                   const std::string &operation, const nlohmann::json &input,
                   nlohmann::json *output) {
    ApiKeyRecord record;
    if (auto err = dispatcher.AdmitRequest(raw_key, capability, &record))
      return err;
    std::string model_id;
    if (auto err = dispatcher.ResolveModel(task, requested, &model_id))
      return err;
    return dispatcher.Execute(model_id, operation, input, output,
                              record.priority);
  }

  std::vector<std::string> InvokedBy() {
    std::lock_guard<std::mutex> lock(order_mutex);
    return invoked_by;
  }

  int RefCount(const std::string &id) const {
    for (const auto &info : slots.Snapshot()) {
      if (info.id == id)
        return info.refcount;
    }
    return -1;
  }

  std::atomic<int> backends_created{0};
  std::atomic<int> in_flight_during_invoke{-1};
  std::mutex order_mutex;
  std::vector<std::string> invoked_by;
  MetricsRegistry metrics;
  KeyRegistry keys;
  RateLimiter limiter;
  ModelCatalog catalog;
  ModelSlotManager slots;
  AdmissionController admission;
  RequestDispatcher dispatcher;
};

} // namespace

TEST_CASE("RequestDispatcher runs the full pipeline", "[dispatcher]") {
  Pipeline p;
  nlohmann::json out;
  auto err = p.Run(kRawKey, Capability::kEmbed, "embed", "",
                                   "echo", {{"texts", {"a"}}}, &out);
  REQUIRE(err.ok());
  REQUIRE(out["echo"]["texts"][0] == "a");
  REQUIRE(p.in_flight_during_invoke == 1);

  // Everything is given back once the call returns.
  REQUIRE(p.RefCount("embedding:a") == 0);
  REQUIRE(p.admission.Stats("embedding:a").in_flight == 0);
  REQUIRE(p.admission.Stats("embedding:a").admitted == 1);
  REQUIRE(p.limiter.Remaining(KeyRegistry::KeyId(kRawKey), {3, 60},
                              Capability::kEmbed) == 2);
}

TEST_CASE("RequestDispatcher rejects bad keys before touching models",
          "[dispatcher]") {
  Pipeline p;
  nlohmann::json out;
  auto missing = p.Run("", Capability::kEmbed, "embed", "",
                                       "echo", {}, &out);
  REQUIRE(missing.kind == ErrorKind::kAuth);
  REQUIRE(missing.code == "missing_api_key");

  auto wrong = p.Run("mg_dispatcher_test_key_9999",
                                     Capability::kEmbed, "embed", "", "echo",
                                     {}, &out);
  REQUIRE(wrong.kind == ErrorKind::kAuth);
  REQUIRE(wrong.code == "invalid_api_key");

  REQUIRE(p.backends_created == 0);
  REQUIRE(p.metrics.DenialCount("authentication_error") == 2);
}

TEST_CASE("RequestDispatcher checks capability before quota", "[dispatcher]") {
  Pipeline p;
  nlohmann::json out;
  auto err = p.Run(kRawKey, Capability::kGenerate, "chat", "",
                                   "echo", {}, &out);
  REQUIRE(err.kind == ErrorKind::kPermissionDenied);
  REQUIRE(err.code == "missing_capability");
  REQUIRE(p.limiter.Remaining(KeyRegistry::KeyId(kRawKey), {3, 60},
                              Capability::kGenerate) == 3);
  REQUIRE(p.backends_created == 0);
}

TEST_CASE("RequestDispatcher rate limits before resolving the model",
          "[dispatcher]") {
  Pipeline p;
  nlohmann::json out;
  for (int i = 0; i < 3; ++i) {
    REQUIRE(p.Run(kRawKey, Capability::kEmbed, "embed", "",
                                  "echo", {}, &out)
                .ok());
  }
  auto limited = p.Run(kRawKey, Capability::kEmbed, "embed",
                                       "no:such-model", "echo", {}, &out);
  REQUIRE(limited.kind == ErrorKind::kRateLimited);
  REQUIRE(limited.retry_after.count() >= 1);
  REQUIRE(p.metrics.DenialCount("rate_limit_exceeded") == 1);
}

TEST_CASE("RequestDispatcher validates the model after consuming quota",
          "[dispatcher]") {
  Pipeline p;
  nlohmann::json out;
  auto err = p.Run(kRawKey, Capability::kEmbed, "embed",
                                   "embedding:missing", "echo", {}, &out);
  REQUIRE(err.kind == ErrorKind::kValidation);
  REQUIRE(p.limiter.Remaining(KeyRegistry::KeyId(kRawKey), {3, 60},
                              Capability::kEmbed) == 2);
  REQUIRE(p.backends_created == 0);
}

TEST_CASE("RequestDispatcher maps backend exceptions and releases resources",
          "[dispatcher]") {
  Pipeline p;
  nlohmann::json out;

  auto invalid = p.dispatcher.Execute("embedding:a", "bad_input", {}, &out);
  REQUIRE(invalid.kind == ErrorKind::kValidation);
  REQUIRE(invalid.message == "texts must be a list");
  REQUIRE(p.RefCount("embedding:a") == 0);
  REQUIRE(p.admission.Stats("embedding:a").in_flight == 0);

  auto crashed = p.dispatcher.Execute("embedding:a", "crash", {}, &out);
  REQUIRE(crashed.kind == ErrorKind::kBackend);
  REQUIRE(crashed.code == "backend_error");
  // Engine details stay in the log.
  REQUIRE(crashed.message.find("engine fault") == std::string::npos);
  REQUIRE(p.RefCount("embedding:a") == 0);
  REQUIRE(p.admission.Stats("embedding:a").in_flight == 0);
  REQUIRE(p.metrics.RenderPrometheus().find(
              "modelgate_backend_errors_total{model=\"embedding:a\"} 1") !=
          std::string::npos);
}

TEST_CASE("RequestDispatcher applies per-model admission limits",
          "[dispatcher]") {
  Pipeline p(50ms);
  auto stats = p.admission.Stats("sentiment:a");
  REQUIRE(stats.max_concurrency == 1);
  REQUIRE(stats.max_queue == 2);
  REQUIRE(p.admission.Stats("embedding:a").max_concurrency == 4);

  ExecutionTicket holder;
  REQUIRE(p.admission.Admit("sentiment:a", 10ms, &holder).ok());

  nlohmann::json out;
  auto err = p.dispatcher.Execute("sentiment:a", "echo", {}, &out);
  REQUIRE(err.kind == ErrorKind::kTimeout);
  REQUIRE(err.code == "admission_timeout");
  // The model handle was released even though admission failed.
  REQUIRE(p.RefCount("sentiment:a") == 0);

  holder.Complete();
  REQUIRE(p.dispatcher.Execute("sentiment:a", "echo", {}, &out).ok());
}

TEST_CASE("RequestDispatcher AuthorizeOnly consumes no quota", "[dispatcher]") {
  Pipeline p;
  ApiKeyRecord record;
  for (int i = 0; i < 5; ++i) {
    REQUIRE(p.dispatcher.AuthorizeOnly(kRawKey, Capability::kBusiness, &record)
                .ok());
  }
  REQUIRE(record.owner == "tests");
  REQUIRE(p.limiter.Remaining(record.id, record.rate_limit,
                              Capability::kBusiness) == 3);
}

TEST_CASE("RequestDispatcher queues requests by key priority", "[dispatcher]") {
  Pipeline p(2000ms, true);
  REQUIRE(p.admission.PriorityOrdering());

  ExecutionTicket holder;
  REQUIRE(p.admission.Admit("sentiment:a", 10ms, &holder).ok());

  auto wait_for_queue = [&](int depth) {
    for (int i = 0; i < 200 && p.admission.Stats("sentiment:a").queued < depth;
         ++i)
      std::this_thread::sleep_for(5ms);
  };

  std::atomic<int> failures{0};
  std::thread routine([&] {
    nlohmann::json out;
    if (!p.Run(kRawKey, Capability::kBusiness, "sentiment", "", "echo",
               {{"caller", "routine"}}, &out)
             .ok())
      ++failures;
  });
  wait_for_queue(1);
  std::thread urgent([&] {
    nlohmann::json out;
    if (!p.Run(kUrgentKey, Capability::kBusiness, "sentiment", "", "echo",
               {{"caller", "urgent"}}, &out)
             .ok())
      ++failures;
  });
  wait_for_queue(2);
  REQUIRE(p.admission.Stats("sentiment:a").queued == 2);

  holder.Complete();
  routine.join();
  urgent.join();

  REQUIRE(failures == 0);
  // The later arrival runs first because its key carries a higher priority.
  REQUIRE(p.InvokedBy() == std::vector<std::string>{"urgent", "routine"});
}
