#pragma once

#include "runtime/backends/inference_backend.h"
#include "scheduler/model_catalog.h"
#include "server/errors/gateway_error.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

class MetricsRegistry;
class ModelHandle;

enum class SlotState { kUnloaded, kLoading, kReady, kUnloading, kFailed };

const char *SlotStateName(SlotState state);

// Point-in-time view of one catalog model, for /admin/models and gatectl.
struct SlotInfo {
  std::string id;
  std::string kind;
  std::string provider;
  SlotState state{SlotState::kUnloaded};
  int refcount{0};
  int64_t footprint_mb{0};
  bool pinned{false};
  bool preload{false};
  uint64_t loads{0};
  uint64_t load_failures{0};
  uint64_t evictions{0};
  std::string last_error;
  double idle_seconds{-1}; // -1 until first use
};

// ── ModelSlotManager ────────────────────────────────────────────────────────
// Owns one slot per catalog model and keeps the sum of loaded footprints under
// budget_mb (0 = unlimited).
//
// Acquire() on a ready slot pins it (refcount++) and returns at once. On an
// unloaded or failed slot the first caller becomes the only loader: it
// reserves budget (evicting least-recently-used idle, unpinned models if
// needed), loads with no lock held and publishes the result. Everyone who
// waited on that load sees its outcome; a failed load is retried by the next
// caller.
//
// Lock order: budget_mutex_ -> slot mutex. The slot table is fixed at
// construction and never locked. No lock is held across backend Load/Unload.
class ModelSlotManager {
public:
  using BackendFactoryFn =
      std::function<std::unique_ptr<InferenceBackend>(const ModelSpec &)>;
  using Deadline = std::chrono::steady_clock::time_point;

  // `factory` defaults to BackendFactory::Create. `metrics` may be null.
  ModelSlotManager(const ModelCatalog &catalog, int64_t budget_mb,
                   BackendFactoryFn factory = {},
                   MetricsRegistry *metrics = nullptr);
  ~ModelSlotManager();

  ModelSlotManager(const ModelSlotManager &) = delete;
  ModelSlotManager &operator=(const ModelSlotManager &) = delete;

  // Errors: ModelUnavailable (unknown_model, resource_exhausted,
  // load_failed), Timeout (model_load_timeout) once `deadline` passes while
  // waiting on another caller's load or an in-progress unload.
  GatewayError Acquire(const std::string &model_id, ModelHandle *handle,
                       std::optional<Deadline> deadline = std::nullopt);

  // Loads every model marked preload. Returns the number that failed.
  int Preload();
  // Ensures the model is loaded without keeping a reference to it.
  GatewayError Load(const std::string &model_id);
  // Unloads an idle model. NotFound for unknown ids, ModelUnavailable
  // "model_busy" while requests hold it or a load is running.
  GatewayError Unload(const std::string &model_id);
  // Unloads every idle model; busy ones are skipped and logged.
  void Shutdown();

  std::vector<SlotInfo> Snapshot() const;
  int64_t ReservedMb() const;
  int64_t BudgetMb() const { return budget_mb_; }

private:
  friend class ModelHandle;

  struct LoadAttempt {
    bool done{false};
    GatewayError error;
  };

  struct Slot {
    ModelSpec spec;
    int64_t footprint_mb{0};

    std::mutex mutex;
    std::condition_variable cv;
    SlotState state{SlotState::kUnloaded};
    int refcount{0};
    std::chrono::steady_clock::time_point last_access{};
    std::shared_ptr<InferenceBackend> backend;
    std::shared_ptr<LoadAttempt> attempt;
    std::string last_error;
    uint64_t loads{0};
    uint64_t load_failures{0};
    uint64_t evictions{0};
  };

  Slot *FindSlot(const std::string &model_id) const;
  void Release(Slot *slot);

  // Runs the whole load for a slot already marked kLoading by the caller.
  // Returns the backend on success; the caller publishes the result.
  GatewayError RunLoad(Slot *slot, std::shared_ptr<InferenceBackend> *backend);
  // Reserves slot->footprint_mb, choosing victims when over budget. Victims
  // come back marked kUnloading and their footprint already released.
  GatewayError ReserveBudget(Slot *slot, std::vector<Slot *> *victims);
  void ReleaseBudget(int64_t mb);
  void Evict(Slot *victim);
  // Unloads a slot the caller marked kUnloading.
  void FinishUnload(Slot *slot, std::shared_ptr<InferenceBackend> backend,
                    bool eviction);
  void PublishMemoryLocked() const;

  std::vector<std::unique_ptr<Slot>> slots_;
  std::unordered_map<std::string, Slot *> by_id_;
  int64_t budget_mb_;
  BackendFactoryFn factory_;
  MetricsRegistry *metrics_;

  mutable std::mutex budget_mutex_;
  int64_t reserved_mb_{0};
};

// RAII reference to a ready model. While any handle is alive the model
// cannot be evicted or unloaded. Move-only; releases on destruction.
class ModelHandle {
public:
  ModelHandle() = default;
  ~ModelHandle() { Release(); }

  ModelHandle(ModelHandle &&other) noexcept;
  ModelHandle &operator=(ModelHandle &&other) noexcept;
  ModelHandle(const ModelHandle &) = delete;
  ModelHandle &operator=(const ModelHandle &) = delete;

  explicit operator bool() const { return slot_ != nullptr; }
  InferenceBackend *backend() const { return backend_.get(); }
  InferenceBackend *operator->() const { return backend_.get(); }
  const ModelSpec &spec() const;
  const std::string &model_id() const { return spec().id; }

  void Release();

private:
  friend class ModelSlotManager;
  ModelHandle(ModelSlotManager *manager, ModelSlotManager::Slot *slot,
              std::shared_ptr<InferenceBackend> backend)
      : manager_(manager), slot_(slot), backend_(std::move(backend)) {}

  ModelSlotManager *manager_{nullptr};
  ModelSlotManager::Slot *slot_{nullptr};
  std::shared_ptr<InferenceBackend> backend_;
};

} // namespace modelgate
