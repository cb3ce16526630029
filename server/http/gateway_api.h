#pragma once

#include "scheduler/admission_controller.h"
#include "scheduler/model_slot_manager.h"
#include "scheduler/request_dispatcher.h"
#include "server/auth/api_key_record.h"
#include "server/auth/key_registry.h"
#include "server/errors/gateway_error.h"
#include "server/http/http_server.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace modelgate {

class AuditLogger;
class MetricsRegistry;

// Maps HTTP requests onto the dispatcher and the admin surfaces. Stateless
// apart from the references it holds; safe to call from every worker thread.
//
// Order per request: CORS preflight and liveness checks first, then the key
// (401 before anything else, including unknown routes), then the route, then
// authorize + rate limit, then payload validation and the model call.
class GatewayApi {
 public:
  GatewayApi(RequestDispatcher& dispatcher,
             KeyRegistry& keys,
             ModelSlotManager& slots,
             AdmissionController& admission,
             MetricsRegistry* metrics,
             AuditLogger* audit,
             RateLimitPolicy default_rate_limit);

  HttpReply Handle(const HttpRequest& request);

  // {"error": {type, code, message, retryable, retry_after?}} with the
  // matching status, Retry-After and WWW-Authenticate headers.
  static HttpReply ErrorReply(const GatewayError& err);

  // Key as shown to admins. Never includes the digest. now is unix seconds.
  static nlohmann::json KeyToJson(const ApiKeyRecord& record, int64_t now);

 private:
  struct Context {
    const HttpRequest& request;
    ApiKeyRecord key;
    std::string param;  // trailing path segment of prefix routes
    std::string model;  // model that served the request, for the audit log
    int status{200};
    nlohmann::json body;
    std::string text_body;  // replaces body when set (Prometheus text)
  };

  using Handler = GatewayError (GatewayApi::*)(Context& ctx);

  enum class Quota { kConsume, kFree };

  struct Route {
    const char* method;
    const char* path;  // normalized: no trailing slash
    Capability capability;
    Quota quota;
    Handler handler;
    bool prefix;  // path is followed by one parameter segment
  };

  static const std::vector<Route>& Routes();
  static std::string NormalizePath(const std::string& path);
  // nullptr when nothing matches; *param receives the prefix route argument.
  static const Route* FindRoute(const std::string& method,
                                const std::string& path,
                                std::string* param);
  static std::string ExtractKey(const HttpRequest& request);

  HttpReply Finish(Context* ctx, const Route* route, const GatewayError& err,
                   std::chrono::steady_clock::time_point started);

  // Resolves the task's model (honouring an optional "model" field) and runs
  // one operation on it.
  GatewayError Run(Context& ctx, const std::string& task,
                   const std::string& operation, const nlohmann::json& input,
                   nlohmann::json* output);

  GatewayError HandleChat(Context& ctx);
  GatewayError HandleCompletion(Context& ctx);
  GatewayError HandleGenerate(Context& ctx, const std::string& task);
  GatewayError HandleGenerateInfo(Context& ctx);
  GatewayError HandleTranscribe(Context& ctx);
  GatewayError HandleTranscribeTranslate(Context& ctx);
  GatewayError HandleSpeech(Context& ctx, const std::string& task);
  GatewayError HandleSpeechFormats(Context& ctx);
  GatewayError HandleSpeechLanguages(Context& ctx);
  GatewayError HandleEmbeddings(Context& ctx);
  GatewayError HandleSimilarity(Context& ctx);
  GatewayError HandleEmbeddingInfo(Context& ctx);
  GatewayError HandleOcr(Context& ctx);
  GatewayError HandleOcrBatch(Context& ctx);
  GatewayError HandleOcrDetectLanguages(Context& ctx);
  GatewayError HandleOcrLanguages(Context& ctx);
  GatewayError HandleOcrTables(Context& ctx);
  GatewayError HandleOcrHealth(Context& ctx);
  GatewayError HandleClassify(Context& ctx);
  GatewayError HandleSentiment(Context& ctx);
  GatewayError HandleEntities(Context& ctx);
  GatewayError HandleSummarize(Context& ctx);
  GatewayError HandleTranslate(Context& ctx);
  GatewayError HandleComprehensive(Context& ctx);
  GatewayError HandleBusinessHealth(Context& ctx);

  GatewayError HandleCreateKey(Context& ctx);
  GatewayError HandleListKeys(Context& ctx);
  GatewayError HandleRevokeKey(Context& ctx);
  GatewayError HandleActivateKey(Context& ctx);
  GatewayError HandleUpdateKey(Context& ctx);
  GatewayError HandleKeyStats(Context& ctx);
  GatewayError HandleKeyInfo(Context& ctx);
  GatewayError HandleListModels(Context& ctx);
  GatewayError HandleLoadModel(Context& ctx);
  GatewayError HandleUnloadModel(Context& ctx);
  GatewayError HandleMetrics(Context& ctx);

  // Route, model and slot state for one task; consumes nothing.
  nlohmann::json ServiceHealth(const std::string& task) const;

  void Audit(const Context& ctx, const std::string& action,
             const std::string& target, const GatewayError& err);

  RequestDispatcher& dispatcher_;
  KeyRegistry& keys_;
  ModelSlotManager& slots_;
  AdmissionController& admission_;
  MetricsRegistry* metrics_;
  AuditLogger* audit_;
  RateLimitPolicy default_rate_limit_;
};

}  // namespace modelgate
