#include "policy/key_store.h"
#include "scheduler/admission_controller.h"
#include "scheduler/model_catalog.h"
#include "scheduler/model_slot_manager.h"
#include "scheduler/request_dispatcher.h"
#include "server/auth/key_registry.h"
#include "server/auth/rate_limiter.h"
#include "server/config/gateway_config.h"
#include "server/http/gateway_api.h"
#include "server/http/http_server.h"
#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

void PrintUsage() {
  std::cout << "Usage: modelgated [--config PATH] [--validate] [--init-admin NAME]\n"
            << "  --config PATH      gateway YAML (default config/gateway.yaml)\n"
            << "  --validate         check configuration and model catalog, then exit\n"
            << "  --init-admin NAME  create an admin key in the key store, print it, exit\n";
}

modelgate::RateLimitPolicy DefaultPolicy(const modelgate::GatewayConfig& config) {
  return {config.auth.default_rate_limit, config.auth.window_seconds};
}

// Registers configured keys. Entries were checked by ValidateStaticKeys, so a
// rejection here is a collision with a stored key and is fatal.
bool AddStaticKeys(const modelgate::GatewayConfig& config, modelgate::KeyRegistry* keys) {
  for (const auto& entry : config.auth.api_keys) {
    std::set<modelgate::Capability> capabilities;
    modelgate::ParseCapabilities(entry.capabilities, &capabilities, nullptr);
    auto policy = DefaultPolicy(config);
    if (entry.rate_limit >= 0) {
      policy.max_requests = entry.rate_limit;
    }
    if (entry.window_seconds > 0) {
      policy.window_seconds = entry.window_seconds;
    }
    if (auto err = keys->AddStaticKey(entry.key, entry.owner, capabilities, policy,
                                      entry.priority)) {
      modelgate::log::Error("server", "static key rejected",
                            "owner=" + entry.owner + " error=" + err.message);
      return false;
    }
  }
  return true;
}

int InitAdmin(const modelgate::GatewayConfig& config, const std::string& name) {
  if (config.auth.store_path.empty()) {
    modelgate::log::Error("server", "--init-admin needs auth.store_path (or MODELGATE_KEY_STORE)");
    return 1;
  }
  auto store = std::make_shared<modelgate::FileKeyStore>(config.auth.store_path,
                                                         config.auth.passphrase);
  modelgate::KeyRegistry keys(store);
  if (!keys.LoadFromStore()) {
    modelgate::log::Error("server", "failed to read key store", "path=" + config.auth.store_path);
    return 1;
  }
  modelgate::KeyCreateRequest request;
  request.owner = name;
  request.description = "created by modelgated --init-admin";
  for (auto capability : modelgate::AllCapabilities()) {
    request.capabilities.insert(capability);
  }
  request.rate_limit = {1000, 60};
  modelgate::ApiKeyRecord record;
  std::string raw_key;
  if (auto err = keys.Create(request, &record, &raw_key)) {
    modelgate::log::Error("server", "failed to create admin key", err.message);
    return 1;
  }
  std::cout << "Admin key created for " << name << "\n"
            << "  key_prefix: " << record.id << "\n"
            << "  api_key:    " << raw_key << "\n"
            << "Store it now; it cannot be shown again." << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/gateway.yaml";
  std::string init_admin;
  bool validate_only = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--init-admin" && i + 1 < argc) {
      init_admin = argv[++i];
    } else if (arg == "--validate") {
      validate_only = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      return 0;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      PrintUsage();
      return 2;
    }
  }

  modelgate::GatewayConfig config;
  std::string error;
  if (!modelgate::LoadGatewayConfig(config_path, &config, &error)) {
    modelgate::log::Error("config", "failed to load configuration", error);
    return 1;
  }
  modelgate::ApplyEnvOverrides(&config);

  modelgate::log::SetJsonMode(config.logging.format == "json");
  modelgate::log::Level level;
  if (modelgate::log::ParseLevel(config.logging.level, &level)) {
    modelgate::log::SetLevel(level);
  } else {
    modelgate::log::Warn("config", "unknown log level; using info", "level=" + config.logging.level);
  }

  if (!init_admin.empty()) {
    return InitAdmin(config, init_admin);
  }

  auto catalog = modelgate::BuildCatalog(config);
  auto problems = catalog.Validate(config.models.memory_budget_mb);
  for (const auto& problem : problems) {
    modelgate::log::Error("config", "invalid model catalog", problem);
  }
  auto key_problems = modelgate::ValidateStaticKeys(config);
  for (const auto& problem : key_problems) {
    modelgate::log::Error("config", "invalid static API key", problem);
  }
  if (!problems.empty() || !key_problems.empty()) {
    return 1;
  }
  modelgate::RateLimitScope scope;
  if (!modelgate::ParseRateLimitScope(config.auth.rate_limit_scope, &scope)) {
    modelgate::log::Error("config", "unknown rate_limit_scope",
                          "value=" + config.auth.rate_limit_scope);
    return 1;
  }
  if (validate_only) {
    modelgate::log::Info("config", "configuration is valid",
                         "models=" + std::to_string(catalog.Specs().size()) +
                             " routes=" + std::to_string(catalog.Routes().size()));
    return 0;
  }

  auto& metrics = modelgate::GlobalMetrics();

  std::shared_ptr<modelgate::FileKeyStore> store;
  if (!config.auth.store_path.empty()) {
    store = std::make_shared<modelgate::FileKeyStore>(config.auth.store_path,
                                                      config.auth.passphrase);
  }
  modelgate::KeyRegistry keys(store);
  std::size_t loaded = 0;
  if (store && !keys.LoadFromStore(&loaded)) {
    modelgate::log::Error("server", "failed to read key store", "path=" + config.auth.store_path);
    return 1;
  }
  if (!AddStaticKeys(config, &keys)) {
    return 1;
  }
  if (!keys.HasKeys()) {
    modelgate::log::Warn("server", "no API keys configured; every request will be rejected",
                         "hint=run modelgated --init-admin NAME");
  }

  modelgate::RateLimiter limiter(scope);
  modelgate::ModelSlotManager slots(catalog, config.models.memory_budget_mb, {}, &metrics);
  modelgate::AdmissionController admission(
      {config.models.default_max_concurrency, config.models.default_max_queue},
      config.models.priority_ordering, &metrics);
  modelgate::RequestDispatcher dispatcher(
      keys, limiter, catalog, slots, admission,
      std::chrono::milliseconds(config.models.request_timeout_ms), &metrics);
  modelgate::AuditLogger audit(config.logging.audit_log, config.logging.redact_client_ip);
  modelgate::GatewayApi api(dispatcher, keys, slots, admission, &metrics,
                            audit.Enabled() ? &audit : nullptr, DefaultPolicy(config));

  modelgate::HttpServer::TlsConfig tls;
  tls.enabled = config.server.tls_enabled;
  tls.cert_path = config.server.tls_cert_path;
  tls.key_path = config.server.tls_key_path;
  modelgate::HttpServer server(
      config.server.host, config.server.port,
      [&api](const modelgate::HttpRequest& request) { return api.Handle(request); },
      &metrics, tls, config.server.workers,
      static_cast<std::size_t>(config.server.max_body_mb) * 1024 * 1024);

  int failed = slots.Preload();
  if (failed > 0) {
    modelgate::log::Warn("server", "some preloaded models failed; they will retry on demand",
                         "failed=" + std::to_string(failed));
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  if (!server.Start()) {
    modelgate::log::Error("server", "failed to start HTTP server",
                          "host=" + config.server.host + " port=" + std::to_string(config.server.port));
    slots.Shutdown();
    return 1;
  }
  modelgate::log::Info("server", "modelgated listening",
                       "host=" + config.server.host + " port=" + std::to_string(config.server.port) +
                           " tls=" + (server.TlsEnabled() ? "on" : "off") +
                           " keys_loaded=" + std::to_string(loaded) +
                           " models=" + std::to_string(catalog.Specs().size()) +
                           " budget_mb=" + std::to_string(config.models.memory_budget_mb));

  const auto flush_interval = std::chrono::seconds(
      config.auth.flush_interval_seconds > 0 ? config.auth.flush_interval_seconds : 30);
  auto next_flush = std::chrono::steady_clock::now() + flush_interval;
  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    if (std::chrono::steady_clock::now() >= next_flush) {
      if (!keys.FlushUsage()) {
        modelgate::log::Warn("server", "failed to persist key usage counters");
      }
      limiter.Prune();
      next_flush = std::chrono::steady_clock::now() + flush_interval;
    }
  }

  modelgate::log::Info("server", "shutting down");
  server.Stop();
  slots.Shutdown();
  if (!keys.FlushUsage()) {
    modelgate::log::Warn("server", "failed to persist key usage counters");
  }
  return 0;
}
