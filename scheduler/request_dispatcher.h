#pragma once

#include "scheduler/admission_controller.h"
#include "scheduler/model_catalog.h"
#include "scheduler/model_slot_manager.h"
#include "server/auth/api_key_record.h"
#include "server/auth/key_registry.h"
#include "server/auth/rate_limiter.h"
#include "server/errors/gateway_error.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace modelgate {

class MetricsRegistry;

// ── RequestDispatcher ───────────────────────────────────────────────────────
// Drives one request through the fixed pipeline:
//
//   authenticate -> authorize -> rate limit -> acquire model -> admit
//     -> invoke -> complete -> release
//
// The first failing step ends the request; everything taken so far is given
// back by ModelHandle / ExecutionTicket destructors, including when the
// backend throws.
//
// AdmitRequest() covers the key checks and Execute() the model half, so a
// handler can admit once and run several model calls under that admission.
// Execute() queues with the priority of the admitted key.
class RequestDispatcher {
public:
  RequestDispatcher(KeyRegistry &keys, RateLimiter &limiter,
                    const ModelCatalog &catalog, ModelSlotManager &slots,
                    AdmissionController &admission,
                    std::chrono::milliseconds request_timeout,
                    MetricsRegistry *metrics = nullptr);

  GatewayError Authenticate(const std::string &raw_key, ApiKeyRecord *record);
  // Authenticate, authorize and rate limit.
  GatewayError AdmitRequest(const std::string &raw_key, Capability capability,
                            ApiKeyRecord *record);
  // Authenticate and authorize; consumes no quota.
  GatewayError AuthorizeOnly(const std::string &raw_key, Capability capability,
                             ApiKeyRecord *record);

  GatewayError ResolveModel(const std::string &task,
                            const std::string &requested,
                            std::string *model_id) const;

  // Acquire, admit and invoke under one deadline of request_timeout.
  GatewayError Execute(const std::string &model_id,
                       const std::string &operation,
                       const nlohmann::json &input, nlohmann::json *output,
                       int priority = 0);

  std::chrono::milliseconds RequestTimeout() const { return request_timeout_; }
  const ModelCatalog &Catalog() const { return catalog_; }

private:
  GatewayError Admit(const ApiKeyRecord &record, Capability capability);
  GatewayError Authorize(const ApiKeyRecord &record, Capability capability);
  GatewayError Deny(GatewayError err) const;

  KeyRegistry &keys_;
  RateLimiter &limiter_;
  const ModelCatalog &catalog_;
  ModelSlotManager &slots_;
  AdmissionController &admission_;
  std::chrono::milliseconds request_timeout_;
  MetricsRegistry *metrics_;
};

} // namespace modelgate
