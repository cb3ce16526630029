#include "scheduler/admission_controller.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <algorithm>
#include <vector>

namespace modelgate {

namespace {

AdmissionLimits Sanitize(AdmissionLimits limits) {
  if (limits.max_concurrency < 1)
    limits.max_concurrency = 1;
  if (limits.max_queue < 0)
    limits.max_queue = 0;
  return limits;
}

} // namespace

AdmissionController::AdmissionController(AdmissionLimits defaults,
                                         bool priority_ordering,
                                         MetricsRegistry *metrics)
    : defaults_(Sanitize(defaults)), priority_ordering_(priority_ordering),
      metrics_(metrics) {}

void AdmissionController::Configure(const std::string &model_id,
                                    AdmissionLimits limits) {
  limits = Sanitize(limits);
  Queue *queue = nullptr;
  {
    std::unique_lock<std::shared_mutex> lock(queues_mutex_);
    overrides_[model_id] = limits;
    auto it = queues_.find(model_id);
    if (it != queues_.end())
      queue = it->second.get();
  }
  if (queue) {
    std::lock_guard<std::mutex> lock(queue->mutex);
    queue->limits = limits;
    GrantLocked(queue);
  }
}

AdmissionController::Queue *
AdmissionController::GetQueue(const std::string &model_id) {
  {
    std::shared_lock<std::shared_mutex> lock(queues_mutex_);
    auto it = queues_.find(model_id);
    if (it != queues_.end())
      return it->second.get();
  }
  std::unique_lock<std::shared_mutex> lock(queues_mutex_);
  auto &slot = queues_[model_id];
  if (!slot) {
    slot = std::make_unique<Queue>();
    slot->model_id = model_id;
    auto ov = overrides_.find(model_id);
    slot->limits = ov == overrides_.end() ? defaults_ : ov->second;
  }
  return slot.get();
}

GatewayError AdmissionController::Admit(const std::string &model_id,
                                        std::chrono::milliseconds timeout,
                                        ExecutionTicket *ticket, int priority) {
  return Admit(model_id, std::chrono::steady_clock::now() + timeout, ticket,
               priority);
}

GatewayError AdmissionController::Admit(const std::string &model_id,
                                        Deadline deadline,
                                        ExecutionTicket *ticket, int priority) {
  Queue *queue = GetQueue(model_id);
  const auto start = std::chrono::steady_clock::now();

  std::unique_lock<std::mutex> lock(queue->mutex);
  if (queue->waiters.empty() &&
      queue->in_flight < queue->limits.max_concurrency) {
    ++queue->in_flight;
    ++queue->admitted;
    lock.unlock();
    if (metrics_)
      metrics_->RecordAdmissionWait(0);
    *ticket = ExecutionTicket(this, queue, std::chrono::milliseconds(0));
    return GatewayError::Ok();
  }

  if (queue->limits.max_queue > 0 &&
      static_cast<int>(queue->waiters.size()) >= queue->limits.max_queue) {
    ++queue->rejected;
    lock.unlock();
    if (metrics_)
      metrics_->RecordAdmissionRejected(model_id);
    log::Warn("admission", "queue full, rejecting request",
              "model=" + model_id);
    return GatewayError::ModelUnavailable(
        "admission_queue_full",
        "too many requests queued for model '" + model_id + "'");
  }

  Waiter waiter;
  waiter.priority = priority;
  auto pos = queue->waiters.end();
  if (priority_ordering_) {
    pos = std::find_if(queue->waiters.begin(), queue->waiters.end(),
                       [&](const Waiter *w) { return w->priority < priority; });
  }
  auto entry = queue->waiters.insert(pos, &waiter);
  PublishDepth(*queue, static_cast<int>(queue->waiters.size()));

  const bool granted = queue->cv.wait_until(lock, deadline,
                                            [&] { return waiter.granted; });
  if (!granted) {
    queue->waiters.erase(entry);
    ++queue->timed_out;
    int depth = static_cast<int>(queue->waiters.size());
    PublishDepth(*queue, depth);
    lock.unlock();
    if (metrics_)
      metrics_->RecordAdmissionTimeout(model_id);
    return GatewayError::Timeout("admission_timeout",
                                 "timed out waiting for an execution slot on '" +
                                     model_id + "'");
  }
  // GrantLocked already removed the entry and counted us in flight.
  ++queue->admitted;
  lock.unlock();

  auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  if (metrics_)
    metrics_->RecordAdmissionWait(static_cast<double>(waited.count()));
  *ticket = ExecutionTicket(this, queue, waited);
  return GatewayError::Ok();
}

void AdmissionController::Complete(Queue *queue) {
  std::lock_guard<std::mutex> lock(queue->mutex);
  if (queue->in_flight > 0)
    --queue->in_flight;
  GrantLocked(queue);
}

void AdmissionController::GrantLocked(Queue *queue) {
  bool changed = false;
  while (!queue->waiters.empty() &&
         queue->in_flight < queue->limits.max_concurrency) {
    Waiter *next = queue->waiters.front();
    queue->waiters.pop_front();
    next->granted = true;
    ++queue->in_flight;
    changed = true;
  }
  if (changed) {
    PublishDepth(*queue, static_cast<int>(queue->waiters.size()));
    queue->cv.notify_all();
  }
}

void AdmissionController::PublishDepth(const Queue &queue, int depth) const {
  if (metrics_)
    metrics_->SetQueueDepth(queue.model_id, depth);
}

AdmissionStats AdmissionController::Stats(const std::string &model_id) const {
  const Queue *queue = nullptr;
  AdmissionLimits limits = defaults_;
  {
    std::shared_lock<std::shared_mutex> lock(queues_mutex_);
    auto it = queues_.find(model_id);
    if (it != queues_.end()) {
      queue = it->second.get();
    } else {
      auto ov = overrides_.find(model_id);
      if (ov != overrides_.end())
        limits = ov->second;
    }
  }
  AdmissionStats stats;
  if (!queue) {
    stats.max_concurrency = limits.max_concurrency;
    stats.max_queue = limits.max_queue;
    return stats;
  }
  std::lock_guard<std::mutex> lock(queue->mutex);
  stats.max_concurrency = queue->limits.max_concurrency;
  stats.max_queue = queue->limits.max_queue;
  stats.in_flight = queue->in_flight;
  stats.queued = static_cast<int>(queue->waiters.size());
  stats.admitted = queue->admitted;
  stats.timed_out = queue->timed_out;
  stats.rejected = queue->rejected;
  return stats;
}

std::map<std::string, AdmissionStats> AdmissionController::AllStats() const {
  std::vector<std::string> ids;
  {
    std::shared_lock<std::shared_mutex> lock(queues_mutex_);
    for (const auto &[id, queue] : queues_)
      ids.push_back(id);
  }
  std::map<std::string, AdmissionStats> out;
  for (const auto &id : ids)
    out[id] = Stats(id);
  return out;
}

// ── ExecutionTicket ─────────────────────────────────────────────────────────

ExecutionTicket::ExecutionTicket(ExecutionTicket &&other) noexcept
    : controller_(other.controller_), queue_(other.queue_),
      waited_(other.waited_) {
  other.controller_ = nullptr;
  other.queue_ = nullptr;
}

ExecutionTicket &ExecutionTicket::operator=(ExecutionTicket &&other) noexcept {
  if (this != &other) {
    Complete();
    controller_ = other.controller_;
    queue_ = other.queue_;
    waited_ = other.waited_;
    other.controller_ = nullptr;
    other.queue_ = nullptr;
  }
  return *this;
}

void ExecutionTicket::Complete() {
  if (controller_ && queue_) {
    controller_->Complete(queue_);
  }
  controller_ = nullptr;
  queue_ = nullptr;
}

} // namespace modelgate
