#include <catch2/catch.hpp>

#include "server/http/gateway_api.h"
#include "server/metrics/metrics.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

using namespace modelgate;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

const std::string kAdminKey = "mg_gateway_admin_key_00000001";
const std::string kBusinessKey = "mg_gateway_biz_key_000000002";

// Canned answers per operation; "summarize" can be told to fail.
class CannedBackend : public InferenceBackend {
 public:
  explicit CannedBackend(std::atomic<bool>* fail_summaries) : fail_summaries_(fail_summaries) {}

  bool Load(const ModelSpec&, std::string*) override { return true; }
  void Unload() override {}
  bool IsReady() const override { return true; }
  json Invoke(const std::string& operation, const json& input) override {
    if (operation == "sentiment") {
      return {{"sentiment", "positive"}, {"score", 0.8}};
    }
    if (operation == "entities") {
      return {{"entities",
               {{{"type", "PER"}, {"text", "Ana"}, {"start", 0}, {"end", 3}, {"score", 0.9}},
                {{"type", "LOC"}, {"text", "Madrid"}, {"start", 12}, {"end", 18}, {"score", 0.8}}}}};
    }
    if (operation == "summarize") {
      if (fail_summaries_->load()) {
        throw std::runtime_error("summarizer crashed");
      }
      return {{"summary", "Ana lives in Madrid."}};
    }
    if (operation == "recognize") {
      if (input.value("image", std::string()) == "ZmFpbA==") {
        throw std::invalid_argument("unreadable image");
      }
      return {{"texts",
               {{{"text", "Qty"}, {"confidence", 0.8}, {"bbox", {{50, 1}, {80, 1}, {80, 11}, {50, 11}}}},
                {{"text", "Item"}, {"confidence", 0.9}, {"bbox", {{0, 0}, {40, 0}, {40, 10}, {0, 10}}}},
                {{"text", "Apple"}, {"confidence", 0.7}, {"bbox", {{0, 20}, {40, 20}, {40, 30}, {0, 30}}}}}}};
    }
    if (operation == "transcribe") {
      return {{"text", "hola"}, {"language", input.at("language")}, {"task", input.at("task")}};
    }
    if (operation == "info") {
      return {{"name", "canned"}, {"context_size", 2048}};
    }
    if (operation == "embed") {
      json vectors = json::array();
      for (std::size_t i = 0; i < input.at("texts").size(); ++i) {
        vectors.push_back({0.6, 0.8});
      }
      return {{"embeddings", vectors}, {"dimensions", 2}};
    }
    throw std::invalid_argument("unsupported operation '" + operation + "'");
  }
  std::vector<std::string> Operations() const override {
    return {"sentiment", "entities", "summarize", "embed", "recognize", "transcribe", "info"};
  }
  std::string Name() const override { return "canned"; }

 private:
  std::atomic<bool>* fail_summaries_;
};

ModelSpec Model(const std::string& id, const std::string& kind) {
  ModelSpec spec;
  spec.id = id;
  spec.kind = kind;
  spec.memory_mb = 10;
  return spec;
}

ModelCatalog TestCatalog() {
  ModelCatalog catalog;
  catalog.Add(Model("embedding:canned", "embedding"));
  catalog.Add(Model("sentiment:canned", "sentiment"));
  catalog.Add(Model("ner:canned", "ner"));
  catalog.Add(Model("summarizer:canned", "summarizer"));
  catalog.Add(Model("ocr:canned", "ocr"));
  catalog.Add(Model("speech:canned", "speech"));
  catalog.Add(Model("llm:canned", "llm"));
  catalog.SetRoute("sentiment", "sentiment:canned");
  catalog.SetRoute("entities", "ner:canned");
  catalog.SetRoute("summarize", "summarizer:canned");
  return catalog;
}

json Body(const HttpReply& reply) { return json::parse(reply.body); }

struct Gateway {
  Gateway()
      : keys(nullptr, [this] { return now.load(); }),
        catalog(TestCatalog()),
        slots(catalog, 0,
              [this](const ModelSpec&) -> std::unique_ptr<InferenceBackend> {
                return std::make_unique<CannedBackend>(&fail_summaries);
              },
              &metrics),
        admission({4, 0}, false, &metrics),
        dispatcher(keys, limiter, catalog, slots, admission, 2000ms, &metrics),
        api(dispatcher, keys, slots, admission, &metrics, nullptr, {60, 60}) {
    keys.AddStaticKey(kAdminKey, "ops", {Capability::kAdmin}, {0, 60});
    keys.AddStaticKey(kBusinessKey, "crm", {Capability::kBusiness, Capability::kEmbed}, {2, 60});
  }

  HttpReply Call(const std::string& method, const std::string& path, const std::string& key,
                 const json& body = nullptr,
                 const std::map<std::string, std::string>& query = {}) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.query = query;
    request.client_ip = "127.0.0.1";
    if (!key.empty()) {
      request.headers["x-api-key"] = key;
    }
    if (!body.is_null()) {
      request.headers["content-type"] = "application/json";
      request.body = body.dump();
    }
    return api.Handle(request);
  }

  // Raw key of a fresh admin-created key with the given capabilities.
  std::string CreateKey(const std::vector<std::string>& capabilities, json extra = json::object()) {
    extra["name"] = "test-client";
    extra["capabilities"] = capabilities;
    auto reply = Call("POST", "/admin/keys/create", kAdminKey, extra);
    REQUIRE(reply.status == 201);
    return Body(reply)["api_key"];
  }

  std::atomic<bool> fail_summaries{false};
  std::atomic<int64_t> now{1'000'000'000};  // 2001-09-09T01:46:40Z
  MetricsRegistry metrics;
  KeyRegistry keys;
  RateLimiter limiter;
  ModelCatalog catalog;
  ModelSlotManager slots;
  AdmissionController admission;
  RequestDispatcher dispatcher;
  GatewayApi api;
};

std::string HeaderValue(const HttpReply& reply, const std::string& name) {
  for (const auto& header : reply.headers) {
    if (header.first == name) {
      return header.second;
    }
  }
  return {};
}

}  // namespace

TEST_CASE("GatewayApi answers preflight and liveness without a key", "[api]") {
  Gateway gw;
  auto preflight = gw.Call("OPTIONS", "/business/sentiment", "");
  REQUIRE(preflight.status == 204);
  REQUIRE(preflight.content_type.empty());
  REQUIRE(HeaderValue(preflight, "Access-Control-Allow-Headers").find("X-API-Key") !=
          std::string::npos);

  auto health = gw.Call("GET", "/healthz", "");
  REQUIRE(health.status == 200);
  REQUIRE(Body(health)["status"] == "ok");
}

TEST_CASE("GatewayApi authenticates before routing", "[api]") {
  Gateway gw;
  auto anonymous = gw.Call("GET", "/no/such/route", "");
  REQUIRE(anonymous.status == 401);
  REQUIRE(HeaderValue(anonymous, "WWW-Authenticate") == "ApiKey");
  auto error = Body(anonymous)["error"];
  REQUIRE(error["type"] == "authentication_error");
  REQUIRE(error["code"] == "missing_api_key");
  REQUIRE(error["retryable"] == false);

  auto unknown = gw.Call("GET", "/no/such/route", kBusinessKey);
  REQUIRE(unknown.status == 404);
  REQUIRE(Body(unknown)["error"]["code"] == "not_found");
  REQUIRE(gw.metrics.RequestCount("unmatched", 404) == 1);
}

TEST_CASE("GatewayApi accepts bearer tokens", "[api]") {
  Gateway gw;
  HttpRequest request;
  request.method = "GET";
  request.path = "/business/health/";
  request.headers["authorization"] = "Bearer " + kBusinessKey;
  auto reply = gw.api.Handle(request);
  REQUIRE(reply.status == 200);
  auto body = Body(reply);
  REQUIRE(body["total"] == 5);
  REQUIRE(body["services"]["sentiment"]["enabled"] == true);
  REQUIRE(body["services"]["sentiment"]["status"] == "unloaded");
  REQUIRE(body["services"]["translate"]["enabled"] == false);
}

TEST_CASE("GatewayApi denies routes outside the key's capabilities", "[api]") {
  Gateway gw;
  auto reply = gw.Call("GET", "/admin/keys/list", kBusinessKey);
  REQUIRE(reply.status == 403);
  REQUIRE(Body(reply)["error"]["code"] == "missing_capability");

  // Admin does not imply the service capabilities.
  auto admin = gw.Call("POST", "/business/sentiment", kAdminKey, {{"text", "great"}});
  REQUIRE(admin.status == 403);
}

TEST_CASE("GatewayApi returns 429 with Retry-After once the quota is spent", "[api]") {
  Gateway gw;
  json body = {{"text", "The service was great"}};
  REQUIRE(gw.Call("POST", "/business/sentiment", kBusinessKey, body).status == 200);
  REQUIRE(gw.Call("POST", "/business/sentiment", kBusinessKey, body).status == 200);

  auto limited = gw.Call("POST", "/business/sentiment", kBusinessKey, body);
  REQUIRE(limited.status == 429);
  auto retry_after = HeaderValue(limited, "Retry-After");
  REQUIRE_FALSE(retry_after.empty());
  REQUIRE(std::stoi(retry_after) >= 1);
  auto error = Body(limited)["error"];
  REQUIRE(error["type"] == "rate_limit_exceeded");
  REQUIRE(error["retryable"] == true);
  REQUIRE(error["retry_after"] == std::stoi(retry_after));

  // The health summary consumes no quota.
  for (int i = 0; i < 3; ++i) {
    REQUIRE(gw.Call("GET", "/business/health", kBusinessKey).status == 200);
  }
}

TEST_CASE("GatewayApi validates payloads", "[api]") {
  Gateway gw;
  HttpRequest broken;
  broken.method = "POST";
  broken.path = "/business/sentiment";
  broken.headers["x-api-key"] = kBusinessKey;
  broken.body = "{not json";
  auto reply = gw.api.Handle(broken);
  REQUIRE(reply.status == 400);
  REQUIRE(Body(reply)["error"]["type"] == "validation_error");

  auto blank = gw.Call("POST", "/business/sentiment", kBusinessKey, {{"text", "   "}});
  REQUIRE(blank.status == 400);
  REQUIRE(Body(blank)["error"]["message"] == "'text' must not be blank");
}

TEST_CASE("GatewayApi serves a business task with the routed model", "[api]") {
  Gateway gw;
  auto reply = gw.Call("POST", "/business/entities", kBusinessKey,
                       {{"text", "Ana lives in Madrid"}});
  REQUIRE(reply.status == 200);
  auto body = Body(reply);
  REQUIRE(body["model"] == "ner:canned");
  REQUIRE(body["total_entities"] == 2);
  REQUIRE(body["entities"]["PER"][0]["text"] == "Ana");
  REQUIRE(body["counts"]["LOC"] == 1);
  REQUIRE(gw.metrics.RequestCount("/business/entities", 200) == 1);
}

TEST_CASE("GatewayApi computes similarity from embeddings", "[api]") {
  Gateway gw;
  auto reply = gw.Call("POST", "/embeddings/similarity", kBusinessKey,
                       {{"text1", "invoice overdue"}, {"text2", "late payment"}});
  REQUIRE(reply.status == 200);
  auto body = Body(reply);
  REQUIRE(body["similarity"] == 1.0);
  REQUIRE(body["similarity_percentage"] == 100.0);
  REQUIRE(body["model"] == "embedding:canned");
}

TEST_CASE("GatewayApi comprehensive analysis reports partial failures", "[api]") {
  Gateway gw;
  gw.fail_summaries = true;
  auto reply = gw.Call("POST", "/business/analyze/comprehensive", kBusinessKey,
                       {{"text", "Ana lives in Madrid. She works at the central office."}});
  REQUIRE(reply.status == 200);
  auto body = Body(reply);
  REQUIRE(body["analysis"]["sentiment"]["status"] == "success");
  REQUIRE(body["analysis"]["entities"]["status"] == "success");
  REQUIRE(body["analysis"]["entities"]["total_entities"] == 2);
  REQUIRE(body["analysis"]["summary"]["status"] == "error");
  REQUIRE(body["analysis"]["summary"]["error"] == "backend_error");
  REQUIRE(body["metadata"]["success_rate"] == "67%");
  REQUIRE(body["metadata"]["word_count"] == 10);
  REQUIRE(body["statistics"]["sentences"] == 2);

  // One admission for the whole analysis.
  REQUIRE(gw.limiter.Remaining(KeyRegistry::KeyId(kBusinessKey), {2, 60},
                               Capability::kBusiness) == 1);
}

TEST_CASE("GatewayApi admin creates keys that work immediately", "[api]") {
  Gateway gw;
  auto created = gw.Call("POST", "/admin/keys/create", kAdminKey,
                         {{"name", "reporting"}, {"rate_limit", 5}, {"expires_in_days", 30}});
  REQUIRE(created.status == 201);
  auto body = Body(created);
  const std::string raw_key = body["api_key"];
  REQUIRE(raw_key.rfind("mg_", 0) == 0);
  REQUIRE(body["key_prefix"] == KeyRegistry::KeyId(raw_key));
  REQUIRE(body["key"]["is_admin"] == false);
  REQUIRE(body["key"]["rate_limit"] == 5);
  REQUIRE_FALSE(body["expires_at"].is_null());
  REQUIRE(body["key"].find("digest") == body["key"].end());

  REQUIRE(gw.Call("GET", "/business/health", raw_key).status == 200);
  REQUIRE(gw.Call("GET", "/metrics", raw_key).status == 403);

  auto short_name = gw.Call("POST", "/admin/keys/create", kAdminKey, {{"name", "ab"}});
  REQUIRE(short_name.status == 400);
}

TEST_CASE("GatewayApi admin revokes and inspects keys", "[api]") {
  Gateway gw;
  auto created = Body(gw.Call("POST", "/admin/keys", kAdminKey,
                              {{"name", "temporary"}, {"capabilities", {"business"}}}));
  const std::string raw_key = created["api_key"];
  const std::string prefix = created["key_prefix"];

  auto revoked = gw.Call("POST", "/admin/keys/revoke", kAdminKey, {{"key_prefix", prefix}});
  REQUIRE(revoked.status == 200);
  REQUIRE(gw.Call("GET", "/business/health", raw_key).status == 401);

  auto info = gw.Call("GET", "/admin/keys/info/" + prefix, kAdminKey);
  REQUIRE(info.status == 200);
  REQUIRE(Body(info)["key"]["is_active"] == false);

  auto missing = gw.Call("GET", "/admin/keys/info/mg_unknown00", kAdminKey);
  REQUIRE(missing.status == 404);

  auto stats = Body(gw.Call("GET", "/admin/keys/stats", kAdminKey));
  REQUIRE(stats["data"]["total_keys"] == 3);
  REQUIRE(stats["data"]["revoked_keys"] == 1);
}

TEST_CASE("GatewayApi admin manages model residency", "[api]") {
  Gateway gw;
  auto loaded = gw.Call("POST", "/admin/models/load", kAdminKey, {{"model", "sentiment:canned"}});
  REQUIRE(loaded.status == 200);
  REQUIRE(Body(loaded)["state"] == "ready");

  auto listing = Body(gw.Call("GET", "/admin/models", kAdminKey));
  REQUIRE(listing["models"].size() == 7);
  bool found = false;
  for (const auto& model : listing["models"]) {
    if (model["id"] == "sentiment:canned") {
      found = true;
      REQUIRE(model["state"] == "ready");
      REQUIRE(model["loads"] == 1);
    }
  }
  REQUIRE(found);
  REQUIRE(listing["routes"]["entities"] == "ner:canned");

  auto unloaded = gw.Call("POST", "/admin/models/unload", kAdminKey, {{"model", "sentiment:canned"}});
  REQUIRE(unloaded.status == 200);

  auto unknown = gw.Call("POST", "/admin/models/load", kAdminKey, {{"model", "llm:ghost"}});
  REQUIRE(unknown.status == 404);
}

TEST_CASE("GatewayApi exposes Prometheus metrics to admins", "[api]") {
  Gateway gw;
  gw.Call("POST", "/business/sentiment", kBusinessKey, {{"text", "fine"}});
  auto reply = gw.Call("GET", "/metrics", kAdminKey);
  REQUIRE(reply.status == 200);
  REQUIRE(reply.content_type.rfind("text/plain", 0) == 0);
  REQUIRE(reply.body.find("modelgate_requests_total{route=\"/business/sentiment\",status=\"200\"} 1") !=
          std::string::npos);
}

TEST_CASE("GatewayApi confines an embeddings-only key to embeddings", "[api]") {
  Gateway gw;
  auto embed_only = gw.CreateKey({"embed"});

  auto embedded = gw.Call("POST", "/embeddings/", embed_only, {{"texts", {"a", "b"}}});
  REQUIRE(embedded.status == 200);
  auto body = Body(embedded);
  REQUIRE(body["embeddings"].size() == 2);
  REQUIRE(body["model"] == "embedding:canned");

  auto denied = gw.Call("POST", "/transcribe/", embed_only, {{"audio", "UklGRg=="}});
  REQUIRE(denied.status == 403);
  REQUIRE(Body(denied)["error"]["code"] == "missing_capability");
}

TEST_CASE("GatewayApi key timestamps follow the registry clock", "[api]") {
  Gateway gw;
  auto created = gw.Call("POST", "/admin/keys/create", kAdminKey,
                         {{"name", "short-lived"}, {"capabilities", {"business"}},
                          {"expires_in_days", 1}});
  REQUIRE(created.status == 201);
  auto body = Body(created);
  REQUIRE(body["key"]["created_at"] == "2001-09-09T01:46:40Z");
  REQUIRE(body["expires_at"] == "2001-09-10T01:46:40Z");
  const std::string raw_key = body["api_key"];
  const std::string prefix = body["key_prefix"];
  REQUIRE(gw.Call("GET", "/business/health", raw_key).status == 200);

  gw.now += 2 * 86400;
  auto info = Body(gw.Call("GET", "/admin/keys/info/" + prefix, kAdminKey));
  REQUIRE(info["key"]["is_expired"] == true);
  auto expired = gw.Call("GET", "/business/health", raw_key);
  REQUIRE(expired.status == 401);
  REQUIRE(Body(expired)["error"]["code"] == "expired_api_key");
}

TEST_CASE("GatewayApi reports per-key request history", "[api]") {
  Gateway gw;
  gw.Call("POST", "/business/sentiment", kBusinessKey, {{"text", "fine"}});
  gw.now += 60;
  gw.Call("GET", "/business/health", kBusinessKey);
  gw.Call("GET", "/business/health", kBusinessKey);

  auto reply = gw.Call("GET", "/admin/keys/stats", kAdminKey, nullptr,
                       {{"key_prefix", KeyRegistry::KeyId(kBusinessKey)}});
  REQUIRE(reply.status == 200);
  auto data = Body(reply)["data"];
  REQUIRE(data["total_requests"] == 3);
  REQUIRE(data["unique_endpoints"] == 2);
  REQUIRE(data["first_request"] == "2001-09-09T01:46:40Z");
  REQUIRE(data["last_request"] == "2001-09-09T01:47:40Z");
}

TEST_CASE("GatewayApi admin sets and validates key priority", "[api]") {
  Gateway gw;
  auto created = Body(gw.Call("POST", "/admin/keys/create", kAdminKey,
                              {{"name", "batch-jobs"}, {"capabilities", {"embed"}},
                               {"priority", -5}}));
  REQUIRE(created["key"]["priority"] == -5);
  const std::string prefix = created["key_prefix"];

  auto updated = gw.Call("POST", "/admin/keys/update", kAdminKey,
                         {{"key_prefix", prefix}, {"priority", 10}});
  REQUIRE(updated.status == 200);
  REQUIRE(Body(updated)["key"]["priority"] == 10);

  auto out_of_range = gw.Call("POST", "/admin/keys/update", kAdminKey,
                              {{"key_prefix", prefix}, {"priority", 1000}});
  REQUIRE(out_of_range.status == 400);
}

TEST_CASE("GatewayApi translates speech into the target language", "[api]") {
  Gateway gw;
  auto key = gw.CreateKey({"transcribe"});

  auto translated = gw.Call("POST", "/transcribe/translate", key,
                            {{"audio", "UklGRg=="}, {"target_language", "fr"}});
  REQUIRE(translated.status == 200);
  auto body = Body(translated);
  REQUIRE(body["text"] == "hola");
  REQUIRE(body["language"] == "fr");
  REQUIRE(body["task"] == "translate");
  REQUIRE(body["model"] == "speech:canned");

  auto plain = Body(gw.Call("POST", "/transcribe", key, {{"audio", "UklGRg=="}}));
  REQUIRE(plain["language"] == "es");
  REQUIRE(plain["task"] == "transcribe");

  auto unsupported = gw.Call("POST", "/transcribe/translate", key,
                             {{"audio", "UklGRg=="}, {"target_language", "xx"}});
  REQUIRE(unsupported.status == 400);

  auto formats = Body(gw.Call("GET", "/transcribe/supported-formats", key));
  REQUIRE(formats["max_size_mb"] == 25);
  bool has_mp3 = false;
  for (const auto& format : formats["supported_formats"]) {
    has_mp3 = has_mp3 || format == "mp3";
  }
  REQUIRE(has_mp3);

  auto languages = Body(gw.Call("GET", "/transcribe/supported-languages", key));
  REQUIRE(languages["total"] == 16);
}

TEST_CASE("GatewayApi OCR batch keeps going past a bad image", "[api]") {
  Gateway gw;
  auto key = gw.CreateKey({"ocr"});

  auto reply = gw.Call("POST", "/ocr/batch", key, {{"images", {"aW1n", "ZmFpbA=="}}});
  REQUIRE(reply.status == 200);
  auto body = Body(reply);
  REQUIRE(body["total"] == 2);
  REQUIRE(body["failed"] == 1);
  REQUIRE(body["results"][0]["texts"].size() == 3);
  REQUIRE(body["results"][0]["page"] == 0);
  REQUIRE(body["results"][1]["texts"].empty());
  REQUIRE(body["results"][1]["error"] == "validation_error");

  auto all_failed = gw.Call("POST", "/ocr/batch", key, {{"images", {"ZmFpbA=="}}});
  REQUIRE(all_failed.status == 400);

  json too_many = json::array();
  for (int i = 0; i < 11; ++i) {
    too_many.push_back("aW1n");
  }
  REQUIRE(gw.Call("POST", "/ocr/batch", key, {{"images", too_many}}).status == 400);
  REQUIRE(gw.Call("POST", "/ocr/batch", key, {{"images", {"not base64!"}}}).status == 400);
}

TEST_CASE("GatewayApi OCR tables, languages and health", "[api]") {
  Gateway gw;
  auto key = gw.CreateKey({"ocr"});

  auto health = Body(gw.Call("GET", "/ocr/health", key));
  REQUIRE(health["model"] == "ocr:canned");
  REQUIRE(health["model_loaded"] == false);
  REQUIRE(health["languages_loaded"] == json({"es", "en"}));

  auto tables = gw.Call("POST", "/ocr/extract-tables", key, {{"image", "aW1n"}});
  REQUIRE(tables.status == 200);
  auto rows = Body(tables)["tables"][0]["rows"];
  REQUIRE(rows.size() == 2);
  REQUIRE(rows[0] == json({"Item", "Qty"}));
  REQUIRE(rows[1] == json({"Apple"}));

  auto detected = Body(gw.Call("POST", "/ocr/detect-languages", key,
                               {{"image", "aW1n"}, {"languages", {"es", "en"}}}));
  REQUIRE(detected["detected_languages"] == json({"es", "en"}));
  REQUIRE(detected["confidence"][0] == 0.8);
  REQUIRE(detected["text_regions"] == 3);

  auto supported = Body(gw.Call("GET", "/ocr/supported-languages", key));
  REQUIRE(supported["total_supported"] == 44);

  REQUIRE(Body(gw.Call("GET", "/ocr/health", key))["model_loaded"] == true);
}

TEST_CASE("GatewayApi describes the generation model", "[api]") {
  Gateway gw;
  auto key = gw.CreateKey({"generate"});
  auto reply = gw.Call("GET", "/generate/model-info", key);
  REQUIRE(reply.status == 200);
  auto body = Body(reply);
  REQUIRE(body["name"] == "canned");
  REQUIRE(body["model"] == "llm:canned");
  REQUIRE(gw.Call("GET", "/generate/model-info", kBusinessKey).status == 403);
}

TEST_CASE("GatewayApi keeps plus signs in key prefixes from the path", "[api]") {
  Gateway gw;
  REQUIRE(gw.keys.AddStaticKey("ops+team-static-key-9", "ops", {Capability::kEmbed}, {0, 60}).ok());

  auto info = gw.Call("GET", "/admin/keys/info/ops+team-sta", kAdminKey);
  REQUIRE(info.status == 200);
  REQUIRE(Body(info)["key"]["key_prefix"] == "ops+team-sta");

  REQUIRE(gw.Call("GET", "/admin/keys/info/ops team-sta", kAdminKey).status == 404);
}
