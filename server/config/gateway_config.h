#pragma once

#include "runtime/backends/inference_backend.h"
#include "scheduler/model_catalog.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace modelgate {

// A key declared in configuration rather than created through the admin API.
struct StaticKeyConfig {
  std::string key;
  std::string owner{"static"};
  std::vector<std::string> capabilities;
  int rate_limit{-1};      // -1 = auth.default_rate_limit
  int window_seconds{-1};  // -1 = auth.window_seconds
  int priority{0};         // admission queue priority, higher first
};

struct GatewayConfig {
  struct Server {
    std::string host{"0.0.0.0"};
    int port{8000};
    int workers{4};
    int max_body_mb{32};
    bool tls_enabled{false};
    std::string tls_cert_path;
    std::string tls_key_path;
  } server;

  struct Auth {
    std::string store_path;  // empty = no persistent keys
    std::string passphrase;  // empty = plaintext store
    int default_rate_limit{10};
    int window_seconds{60};
    std::string rate_limit_scope{"per_key"};
    int flush_interval_seconds{30};
    std::vector<StaticKeyConfig> api_keys;
  } auth;

  struct Models {
    int64_t memory_budget_mb{0};  // 0 = unlimited
    int request_timeout_ms{30000};
    int default_max_concurrency{4};
    int default_max_queue{64};  // 0 = unbounded
    bool priority_ordering{false};
    std::vector<ModelSpec> catalog;
    std::map<std::string, std::string> routes;  // task -> model id
  } models;

  struct Logging {
    std::string format{"text"};
    std::string level{"info"};
    std::string audit_log;
    bool redact_client_ip{false};
  } logging;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment.
std::optional<std::string> ProcessEnv(const std::string& name);

// Parses YAML text over the defaults in *config. Returns false with *error set
// on malformed YAML or wrongly typed values.
bool ParseGatewayConfig(const std::string& yaml_text, GatewayConfig* config,
                        std::string* error);
// A missing file leaves the defaults in place and succeeds.
bool LoadGatewayConfig(const std::string& path, GatewayConfig* config,
                       std::string* error);

// Applies MODELGATE_* variables. Unparseable values are logged and ignored.
void ApplyEnvOverrides(GatewayConfig* config, const EnvLookup& env = ProcessEnv);

// Parses "key:cap1|cap2,key2:cap3" as used by MODELGATE_API_KEYS.
std::vector<StaticKeyConfig> ParseApiKeysEnv(const std::string& value);

// Checks auth.api_keys: minimum length, known capabilities, and that no two
// keys share a public key id. Returns one message per problem.
std::vector<std::string> ValidateStaticKeys(const GatewayConfig& config);

ModelCatalog BuildCatalog(const GatewayConfig& config);

}  // namespace modelgate
