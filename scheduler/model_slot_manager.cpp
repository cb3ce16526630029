#include "scheduler/model_slot_manager.h"

#include "runtime/backends/backend_factory.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>
#include <stdexcept>

namespace modelgate {

namespace {

// An Acquire can pin a chosen victim between the scan and the claim; the
// selection is redone this many times before giving up.
constexpr int kMaxEvictionRounds = 3;

template <typename Pred>
bool WaitUntil(std::unique_lock<std::mutex> &lock, std::condition_variable &cv,
               const std::optional<ModelSlotManager::Deadline> &deadline,
               Pred pred) {
  if (!deadline) {
    cv.wait(lock, pred);
    return true;
  }
  return cv.wait_until(lock, *deadline, pred);
}

double MillisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - start)
      .count();
}

} // namespace

const char *SlotStateName(SlotState state) {
  switch (state) {
  case SlotState::kUnloaded:
    return "unloaded";
  case SlotState::kLoading:
    return "loading";
  case SlotState::kReady:
    return "ready";
  case SlotState::kUnloading:
    return "unloading";
  case SlotState::kFailed:
    return "failed";
  }
  return "unknown";
}

ModelSlotManager::ModelSlotManager(const ModelCatalog &catalog,
                                   int64_t budget_mb, BackendFactoryFn factory,
                                   MetricsRegistry *metrics)
    : budget_mb_(budget_mb < 0 ? 0 : budget_mb), factory_(std::move(factory)),
      metrics_(metrics) {
  if (!factory_) {
    factory_ = [](const ModelSpec &spec) { return BackendFactory::Create(spec); };
  }
  for (const auto &spec : catalog.Specs()) {
    if (by_id_.count(spec.id))
      continue;
    auto slot = std::make_unique<Slot>();
    slot->spec = spec;
    slot->footprint_mb = ModelCatalog::FootprintMb(spec);
    by_id_.emplace(spec.id, slot.get());
    slots_.push_back(std::move(slot));
  }
  std::lock_guard<std::mutex> lock(budget_mutex_);
  PublishMemoryLocked();
}

ModelSlotManager::~ModelSlotManager() { Shutdown(); }

ModelSlotManager::Slot *
ModelSlotManager::FindSlot(const std::string &model_id) const {
  auto it = by_id_.find(model_id);
  return it == by_id_.end() ? nullptr : it->second;
}

GatewayError ModelSlotManager::Acquire(const std::string &model_id,
                                       ModelHandle *handle,
                                       std::optional<Deadline> deadline) {
  Slot *slot = FindSlot(model_id);
  if (!slot) {
    return GatewayError::ModelUnavailable(
        "unknown_model", "model '" + model_id + "' is not in the catalog");
  }

  std::unique_lock<std::mutex> lock(slot->mutex);
  for (;;) {
    switch (slot->state) {
    case SlotState::kReady: {
      ++slot->refcount;
      slot->last_access = std::chrono::steady_clock::now();
      auto backend = slot->backend;
      lock.unlock();
      // Assigning may release a handle the caller still holds on this slot.
      *handle = ModelHandle(this, slot, std::move(backend));
      return GatewayError::Ok();
    }
    case SlotState::kLoading: {
      auto attempt = slot->attempt;
      if (!WaitUntil(lock, slot->cv, deadline,
                     [&] { return attempt->done; })) {
        return GatewayError::Timeout("model_load_timeout",
                                     "timed out waiting for model '" +
                                         model_id + "' to load");
      }
      if (attempt->error)
        return attempt->error;
      break; // loaded; re-check in case it was evicted meanwhile
    }
    case SlotState::kUnloading:
      if (!WaitUntil(lock, slot->cv, deadline,
                     [&] { return slot->state != SlotState::kUnloading; })) {
        return GatewayError::Timeout("model_load_timeout",
                                     "timed out waiting for model '" +
                                         model_id + "' to unload");
      }
      break;
    case SlotState::kUnloaded:
    case SlotState::kFailed: {
      auto attempt = std::make_shared<LoadAttempt>();
      slot->attempt = attempt;
      slot->state = SlotState::kLoading;
      lock.unlock();

      std::shared_ptr<InferenceBackend> backend;
      GatewayError err = RunLoad(slot, &backend);

      lock.lock();
      attempt->done = true;
      attempt->error = err;
      if (err) {
        slot->state = SlotState::kFailed;
        slot->last_error = err.message;
        ++slot->load_failures;
      } else {
        slot->state = SlotState::kReady;
        slot->backend = backend;
        slot->last_error.clear();
        ++slot->loads;
        ++slot->refcount;
        slot->last_access = std::chrono::steady_clock::now();
      }
      slot->cv.notify_all();
      lock.unlock();

      if (metrics_)
        metrics_->RecordModelReady(model_id, !err);
      if (err)
        return err;
      *handle = ModelHandle(this, slot, std::move(backend));
      return GatewayError::Ok();
    }
    }
  }
}

GatewayError ModelSlotManager::RunLoad(Slot *slot,
                                       std::shared_ptr<InferenceBackend> *backend) {
  const auto &spec = slot->spec;
  std::vector<Slot *> victims;
  auto err = ReserveBudget(slot, &victims);
  if (err) {
    log::Warn("slots", "cannot reserve memory for model",
              "model=" + spec.id + " need_mb=" + std::to_string(slot->footprint_mb) +
                  " reserved_mb=" + std::to_string(ReservedMb()) +
                  " budget_mb=" + std::to_string(budget_mb_));
    return err;
  }
  for (Slot *victim : victims) {
    Evict(victim);
  }

  const auto start = std::chrono::steady_clock::now();
  std::string error;
  bool ok = false;
  std::unique_ptr<InferenceBackend> created;
  try {
    created = factory_(spec);
    if (!created) {
      error = "no backend for kind '" + spec.kind + "' and provider '" +
              spec.provider + "'";
    } else {
      ok = created->Load(spec, &error);
    }
  } catch (const std::exception &ex) {
    error = ex.what();
    ok = false;
  }
  const double elapsed_ms = MillisSince(start);
  if (metrics_)
    metrics_->RecordModelLoad(spec.id, elapsed_ms, ok);

  if (!ok) {
    ReleaseBudget(slot->footprint_mb);
    log::Error("slots", "model load failed",
               "model=" + spec.id + " error=" + (error.empty() ? "unknown" : error));
    return GatewayError::ModelUnavailable(
        "load_failed", "model '" + spec.id + "' failed to load");
  }
  *backend = std::shared_ptr<InferenceBackend>(std::move(created));
  log::Info("slots", "model loaded",
            "model=" + spec.id + " backend=" + (*backend)->Name() +
                " footprint_mb=" + std::to_string(slot->footprint_mb) +
                " load_ms=" + std::to_string(static_cast<int64_t>(elapsed_ms)));
  return GatewayError::Ok();
}

GatewayError ModelSlotManager::ReserveBudget(Slot *slot,
                                             std::vector<Slot *> *victims) {
  std::lock_guard<std::mutex> budget_lock(budget_mutex_);
  const int64_t need = slot->footprint_mb;
  if (budget_mb_ == 0 || reserved_mb_ + need <= budget_mb_) {
    reserved_mb_ += need;
    PublishMemoryLocked();
    return GatewayError::Ok();
  }

  struct Candidate {
    Slot *slot;
    std::chrono::steady_clock::time_point last_access;
  };

  for (int round = 0; round < kMaxEvictionRounds; ++round) {
    std::vector<Candidate> candidates;
    for (const auto &other : slots_) {
      if (other.get() == slot)
        continue;
      std::lock_guard<std::mutex> lock(other->mutex);
      if (other->state == SlotState::kReady && other->refcount == 0 &&
          !other->spec.pinned) {
        candidates.push_back({other.get(), other->last_access});
      }
    }
    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate &a, const Candidate &b) {
                return a.last_access < b.last_access;
              });

    std::vector<Slot *> chosen;
    int64_t freed = 0;
    for (const auto &candidate : candidates) {
      if (reserved_mb_ - freed + need <= budget_mb_)
        break;
      chosen.push_back(candidate.slot);
      freed += candidate.slot->footprint_mb;
    }
    if (reserved_mb_ - freed + need > budget_mb_) {
      return GatewayError::ModelUnavailable(
          "resource_exhausted",
          "not enough memory to load model '" + slot->spec.id +
              "'; models in use cannot be evicted");
    }

    std::vector<Slot *> claimed;
    bool lost_race = false;
    for (Slot *victim : chosen) {
      std::lock_guard<std::mutex> lock(victim->mutex);
      if (victim->state != SlotState::kReady || victim->refcount != 0) {
        lost_race = true;
        break;
      }
      victim->state = SlotState::kUnloading;
      claimed.push_back(victim);
    }
    if (lost_race) {
      for (Slot *victim : claimed) {
        std::lock_guard<std::mutex> lock(victim->mutex);
        victim->state = SlotState::kReady;
        victim->cv.notify_all();
      }
      continue;
    }

    reserved_mb_ += need - freed;
    PublishMemoryLocked();
    *victims = std::move(claimed);
    return GatewayError::Ok();
  }
  return GatewayError::ModelUnavailable(
      "resource_exhausted",
      "not enough memory to load model '" + slot->spec.id + "'");
}

void ModelSlotManager::ReleaseBudget(int64_t mb) {
  std::lock_guard<std::mutex> lock(budget_mutex_);
  reserved_mb_ = std::max<int64_t>(0, reserved_mb_ - mb);
  PublishMemoryLocked();
}

void ModelSlotManager::Evict(Slot *victim) {
  std::shared_ptr<InferenceBackend> backend;
  {
    std::lock_guard<std::mutex> lock(victim->mutex);
    backend = victim->backend;
  }
  log::Info("slots", "evicting idle model",
            "model=" + victim->spec.id +
                " footprint_mb=" + std::to_string(victim->footprint_mb));
  FinishUnload(victim, std::move(backend), /*eviction=*/true);
}

void ModelSlotManager::FinishUnload(Slot *slot,
                                    std::shared_ptr<InferenceBackend> backend,
                                    bool eviction) {
  if (backend) {
    try {
      backend->Unload();
    } catch (const std::exception &ex) {
      log::Warn("slots", "backend unload raised",
                "model=" + slot->spec.id + " error=" + ex.what());
    }
  }
  // An evicted slot's memory was already handed to the loader that evicted
  // it. Otherwise it is returned before the slot reads as unloaded, so a
  // loader woken by the state change finds it free.
  if (!eviction)
    ReleaseBudget(slot->footprint_mb);
  {
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->backend.reset();
    slot->state = SlotState::kUnloaded;
    if (eviction)
      ++slot->evictions;
    slot->cv.notify_all();
  }
  if (metrics_) {
    metrics_->RecordModelReady(slot->spec.id, false);
    if (eviction)
      metrics_->RecordModelEviction(slot->spec.id);
  }
}

void ModelSlotManager::Release(Slot *slot) {
  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->refcount > 0)
    --slot->refcount;
  slot->last_access = std::chrono::steady_clock::now();
}

int ModelSlotManager::Preload() {
  int failures = 0;
  for (const auto &slot : slots_) {
    if (!slot->spec.preload && !slot->spec.pinned)
      continue;
    auto err = Load(slot->spec.id);
    if (err) {
      ++failures;
      log::Error("slots", "preload failed",
                 "model=" + slot->spec.id + " code=" + err.code);
    }
  }
  return failures;
}

GatewayError ModelSlotManager::Load(const std::string &model_id) {
  ModelHandle handle;
  return Acquire(model_id, &handle);
}

GatewayError ModelSlotManager::Unload(const std::string &model_id) {
  Slot *slot = FindSlot(model_id);
  if (!slot) {
    return GatewayError::NotFound("model '" + model_id +
                                  "' is not in the catalog");
  }
  std::shared_ptr<InferenceBackend> backend;
  {
    std::lock_guard<std::mutex> lock(slot->mutex);
    if (slot->state == SlotState::kUnloaded ||
        slot->state == SlotState::kFailed) {
      return GatewayError::Ok();
    }
    if (slot->state != SlotState::kReady || slot->refcount > 0) {
      return GatewayError::ModelUnavailable(
          "model_busy", "model '" + model_id + "' is in use");
    }
    slot->state = SlotState::kUnloading;
    backend = slot->backend;
  }
  FinishUnload(slot, std::move(backend), /*eviction=*/false);
  log::Info("slots", "model unloaded", "model=" + model_id);
  return GatewayError::Ok();
}

void ModelSlotManager::Shutdown() {
  for (const auto &slot : slots_) {
    auto err = Unload(slot->spec.id);
    if (err) {
      log::Warn("slots", "model still in use at shutdown",
                "model=" + slot->spec.id);
    }
  }
}

std::vector<SlotInfo> ModelSlotManager::Snapshot() const {
  const auto now = std::chrono::steady_clock::now();
  std::vector<SlotInfo> out;
  out.reserve(slots_.size());
  for (const auto &slot : slots_) {
    SlotInfo info;
    info.id = slot->spec.id;
    info.kind = slot->spec.kind;
    info.provider = slot->spec.provider;
    info.footprint_mb = slot->footprint_mb;
    info.pinned = slot->spec.pinned;
    info.preload = slot->spec.preload;
    std::lock_guard<std::mutex> lock(slot->mutex);
    info.state = slot->state;
    info.refcount = slot->refcount;
    info.loads = slot->loads;
    info.load_failures = slot->load_failures;
    info.evictions = slot->evictions;
    info.last_error = slot->last_error;
    if (slot->last_access != std::chrono::steady_clock::time_point{}) {
      info.idle_seconds =
          std::chrono::duration<double>(now - slot->last_access).count();
    }
    out.push_back(std::move(info));
  }
  return out;
}

int64_t ModelSlotManager::ReservedMb() const {
  std::lock_guard<std::mutex> lock(budget_mutex_);
  return reserved_mb_;
}

void ModelSlotManager::PublishMemoryLocked() const {
  if (metrics_)
    metrics_->SetMemoryReserved(reserved_mb_, budget_mb_);
}

// ── ModelHandle ─────────────────────────────────────────────────────────────

ModelHandle::ModelHandle(ModelHandle &&other) noexcept
    : manager_(other.manager_), slot_(other.slot_),
      backend_(std::move(other.backend_)) {
  other.manager_ = nullptr;
  other.slot_ = nullptr;
}

ModelHandle &ModelHandle::operator=(ModelHandle &&other) noexcept {
  if (this != &other) {
    Release();
    manager_ = other.manager_;
    slot_ = other.slot_;
    backend_ = std::move(other.backend_);
    other.manager_ = nullptr;
    other.slot_ = nullptr;
  }
  return *this;
}

const ModelSpec &ModelHandle::spec() const {
  static const ModelSpec kEmpty;
  return slot_ ? slot_->spec : kEmpty;
}

void ModelHandle::Release() {
  if (manager_ && slot_) {
    manager_->Release(slot_);
  }
  manager_ = nullptr;
  slot_ = nullptr;
  backend_.reset();
}

} // namespace modelgate
