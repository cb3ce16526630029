#include "scheduler/request_dispatcher.h"

#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <stdexcept>

namespace modelgate {

RequestDispatcher::RequestDispatcher(KeyRegistry &keys, RateLimiter &limiter,
                                     const ModelCatalog &catalog,
                                     ModelSlotManager &slots,
                                     AdmissionController &admission,
                                     std::chrono::milliseconds request_timeout,
                                     MetricsRegistry *metrics)
    : keys_(keys), limiter_(limiter), catalog_(catalog), slots_(slots),
      admission_(admission), request_timeout_(request_timeout),
      metrics_(metrics) {
  // Per-model limits from the catalog; unset fields fall back to the
  // admission defaults.
  const auto defaults = admission_.Defaults();
  for (const auto &spec : catalog_.Specs()) {
    if (spec.max_concurrency <= 0 && spec.max_queue < 0)
      continue;
    AdmissionLimits limits = defaults;
    if (spec.max_concurrency > 0)
      limits.max_concurrency = spec.max_concurrency;
    if (spec.max_queue >= 0)
      limits.max_queue = spec.max_queue;
    admission_.Configure(spec.id, limits);
  }
}

GatewayError RequestDispatcher::Deny(GatewayError err) const {
  if (metrics_ && err)
    metrics_->RecordDenial(ErrorKindName(err.kind));
  return err;
}

GatewayError RequestDispatcher::Authenticate(const std::string &raw_key,
                                             ApiKeyRecord *record) {
  return Deny(keys_.Authenticate(raw_key, record));
}

GatewayError RequestDispatcher::Authorize(const ApiKeyRecord &record,
                                          Capability capability) {
  return Deny(keys_.Authorize(record, capability));
}

GatewayError RequestDispatcher::Admit(const ApiKeyRecord &record,
                                      Capability capability) {
  if (auto err = keys_.Authorize(record, capability))
    return Deny(err);
  auto err = limiter_.CheckAndConsume(record.id, record.rate_limit, capability);
  if (err) {
    log::Debug("dispatcher", "rate limited",
               "key=" + record.id + " capability=" + CapabilityName(capability) +
                   " retry_after=" + std::to_string(err.retry_after.count()));
  }
  return Deny(err);
}

GatewayError RequestDispatcher::AdmitRequest(const std::string &raw_key,
                                             Capability capability,
                                             ApiKeyRecord *record) {
  if (auto err = Authenticate(raw_key, record))
    return err;
  return Admit(*record, capability);
}

GatewayError RequestDispatcher::AuthorizeOnly(const std::string &raw_key,
                                              Capability capability,
                                              ApiKeyRecord *record) {
  if (auto err = Authenticate(raw_key, record))
    return err;
  return Authorize(*record, capability);
}

GatewayError RequestDispatcher::ResolveModel(const std::string &task,
                                             const std::string &requested,
                                             std::string *model_id) const {
  return catalog_.ResolveModel(task, requested, model_id);
}

GatewayError RequestDispatcher::Execute(const std::string &model_id,
                                        const std::string &operation,
                                        const nlohmann::json &input,
                                        nlohmann::json *output, int priority) {
  const auto deadline = std::chrono::steady_clock::now() + request_timeout_;

  ModelHandle handle;
  if (auto err = slots_.Acquire(model_id, &handle, deadline))
    return err;

  // Declared after the handle so the ticket completes before release.
  ExecutionTicket ticket;
  if (auto err = admission_.Admit(model_id, deadline, &ticket, priority))
    return err;

  try {
    *output = handle->Invoke(operation, input);
  } catch (const std::invalid_argument &ex) {
    return GatewayError::Validation(ex.what());
  } catch (const std::exception &ex) {
    if (metrics_)
      metrics_->RecordBackendError(model_id);
    log::Error("dispatcher", "backend invocation failed",
               "model=" + model_id + " operation=" + operation +
                   " error=" + ex.what());
    return GatewayError::Backend("model '" + model_id +
                                 "' failed to process the request");
  }
  return GatewayError::Ok();
}

} // namespace modelgate
