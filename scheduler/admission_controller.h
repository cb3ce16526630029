#pragma once

#include "server/errors/gateway_error.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace modelgate {

class ExecutionTicket;
class MetricsRegistry;

struct AdmissionLimits {
  int max_concurrency{4};
  int max_queue{0}; // 0 = unbounded
};

struct AdmissionStats {
  int max_concurrency{0};
  int max_queue{0};
  int in_flight{0};
  int queued{0};
  uint64_t admitted{0};
  uint64_t timed_out{0};
  uint64_t rejected{0};
};

// ── AdmissionController ─────────────────────────────────────────────────────
// Caps the number of requests executing on each model. Requests over the cap
// wait in arrival order (or by priority, then arrival, when priority ordering
// is on) until a running request completes and hands its slot over, or until
// their deadline passes.
class AdmissionController {
public:
  using Deadline = std::chrono::steady_clock::time_point;

  AdmissionController(AdmissionLimits defaults, bool priority_ordering = false,
                      MetricsRegistry *metrics = nullptr);

  // Per-model override; applies to queued requests immediately.
  void Configure(const std::string &model_id, AdmissionLimits limits);

  // Errors: ModelUnavailable "admission_queue_full" when the wait queue is at
  // max_queue, Timeout "admission_timeout" when the deadline passes first.
  GatewayError Admit(const std::string &model_id, Deadline deadline,
                     ExecutionTicket *ticket, int priority = 0);
  GatewayError Admit(const std::string &model_id,
                     std::chrono::milliseconds timeout, ExecutionTicket *ticket,
                     int priority = 0);

  AdmissionStats Stats(const std::string &model_id) const;
  std::map<std::string, AdmissionStats> AllStats() const;

  AdmissionLimits Defaults() const { return defaults_; }
  bool PriorityOrdering() const { return priority_ordering_; }

private:
  friend class ExecutionTicket;

  struct Waiter {
    int priority{0};
    bool granted{false};
  };

  struct Queue {
    std::string model_id;
    mutable std::mutex mutex;
    std::condition_variable cv;
    AdmissionLimits limits;
    int in_flight{0};
    std::list<Waiter *> waiters; // next to run at the front
    uint64_t admitted{0};
    uint64_t timed_out{0};
    uint64_t rejected{0};
  };

  Queue *GetQueue(const std::string &model_id);
  void Complete(Queue *queue);
  // Hands free execution slots to waiters. Caller holds queue->mutex.
  void GrantLocked(Queue *queue);
  void PublishDepth(const Queue &queue, int depth) const;

  AdmissionLimits defaults_;
  bool priority_ordering_;
  MetricsRegistry *metrics_;

  mutable std::shared_mutex queues_mutex_;
  std::map<std::string, std::unique_ptr<Queue>> queues_;
  std::map<std::string, AdmissionLimits> overrides_;
};

// RAII execution slot on one model. Completing (explicitly or on
// destruction) hands the slot to the next queued request.
class ExecutionTicket {
public:
  ExecutionTicket() = default;
  ~ExecutionTicket() { Complete(); }

  ExecutionTicket(ExecutionTicket &&other) noexcept;
  ExecutionTicket &operator=(ExecutionTicket &&other) noexcept;
  ExecutionTicket(const ExecutionTicket &) = delete;
  ExecutionTicket &operator=(const ExecutionTicket &) = delete;

  explicit operator bool() const { return queue_ != nullptr; }
  std::chrono::milliseconds waited() const { return waited_; }

  void Complete();

private:
  friend class AdmissionController;
  ExecutionTicket(AdmissionController *controller,
                  AdmissionController::Queue *queue,
                  std::chrono::milliseconds waited)
      : controller_(controller), queue_(queue), waited_(waited) {}

  AdmissionController *controller_{nullptr};
  AdmissionController::Queue *queue_{nullptr};
  std::chrono::milliseconds waited_{0};
};

} // namespace modelgate
