#include "server/config/gateway_config.h"

#include "server/auth/key_registry.h"
#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace modelgate {

namespace {

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool ParseBool(const std::string& value) {
  auto lowered = ToLower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

std::vector<std::string> SplitOn(const std::string& text, char sep) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, sep)) {
    auto trimmed = Trim(item);
    if (!trimmed.empty()) {
      out.push_back(trimmed);
    }
  }
  return out;
}

template <typename T>
void Read(const YAML::Node& node, const char* key, T* out) {
  if (node[key]) {
    *out = node[key].as<T>();
  }
}

ModelSpec ParseModel(const YAML::Node& node) {
  ModelSpec spec;
  Read(node, "id", &spec.id);
  Read(node, "kind", &spec.kind);
  Read(node, "provider", &spec.provider);
  Read(node, "path", &spec.path);
  Read(node, "endpoint", &spec.endpoint);
  Read(node, "memory_mb", &spec.memory_mb);
  Read(node, "max_concurrency", &spec.max_concurrency);
  Read(node, "max_queue", &spec.max_queue);
  Read(node, "pinned", &spec.pinned);
  Read(node, "preload", &spec.preload);
  if (spec.kind.empty()) {
    // "embedding:minilm" carries its kind in the id.
    auto colon = spec.id.find(':');
    if (colon != std::string::npos) {
      spec.kind = spec.id.substr(0, colon);
    }
  }
  spec.provider = ToLower(spec.provider);
  if (node["options"] && node["options"].IsMap()) {
    for (const auto& option : node["options"]) {
      spec.options[option.first.as<std::string>()] = option.second.as<std::string>();
    }
  }
  return spec;
}

StaticKeyConfig ParseStaticKey(const YAML::Node& node) {
  StaticKeyConfig key;
  if (node.IsScalar()) {
    key.key = node.as<std::string>();
    key.capabilities = {"*"};
    return key;
  }
  Read(node, "key", &key.key);
  Read(node, "owner", &key.owner);
  Read(node, "rate_limit", &key.rate_limit);
  Read(node, "window_seconds", &key.window_seconds);
  Read(node, "priority", &key.priority);
  if (node["capabilities"] && node["capabilities"].IsSequence()) {
    for (const auto& cap : node["capabilities"]) {
      key.capabilities.push_back(cap.as<std::string>());
    }
  }
  return key;
}

void OverrideString(const EnvLookup& env, const char* name, std::string* out) {
  if (auto value = env(name)) {
    *out = *value;
  }
}

template <typename T>
void OverrideNumber(const EnvLookup& env, const char* name, T* out) {
  auto value = env(name);
  if (!value) {
    return;
  }
  try {
    std::size_t used = 0;
    long long parsed = std::stoll(*value, &used);
    if (used != value->size()) {
      throw std::invalid_argument("trailing characters");
    }
    *out = static_cast<T>(parsed);
  } catch (const std::exception&) {
    log::Warn("config", "ignoring non-numeric environment override",
              std::string("var=") + name + " value=" + *value);
  }
}

void OverrideBool(const EnvLookup& env, const char* name, bool* out) {
  if (auto value = env(name)) {
    *out = ParseBool(*value);
  }
}

}  // namespace

std::optional<std::string> ProcessEnv(const std::string& name) {
  if (const char* value = std::getenv(name.c_str())) {
    return std::string(value);
  }
  return std::nullopt;
}

bool ParseGatewayConfig(const std::string& yaml_text, GatewayConfig* config,
                        std::string* error) {
  try {
    YAML::Node root = YAML::Load(yaml_text);
    if (!root || root.IsNull()) {
      return true;
    }

    if (auto server = root["server"]) {
      Read(server, "host", &config->server.host);
      Read(server, "port", &config->server.port);
      Read(server, "workers", &config->server.workers);
      Read(server, "max_body_mb", &config->server.max_body_mb);
      if (auto tls = server["tls"]) {
        Read(tls, "enabled", &config->server.tls_enabled);
        Read(tls, "cert_path", &config->server.tls_cert_path);
        Read(tls, "key_path", &config->server.tls_key_path);
      }
    }

    if (auto auth = root["auth"]) {
      Read(auth, "store_path", &config->auth.store_path);
      Read(auth, "passphrase", &config->auth.passphrase);
      Read(auth, "default_rate_limit", &config->auth.default_rate_limit);
      Read(auth, "window_seconds", &config->auth.window_seconds);
      Read(auth, "rate_limit_scope", &config->auth.rate_limit_scope);
      Read(auth, "flush_interval_seconds", &config->auth.flush_interval_seconds);
      if (auth["api_keys"] && auth["api_keys"].IsSequence()) {
        for (const auto& key_node : auth["api_keys"]) {
          auto key = ParseStaticKey(key_node);
          if (!key.key.empty()) {
            config->auth.api_keys.push_back(std::move(key));
          }
        }
      }
    }

    if (auto models = root["models"]) {
      Read(models, "memory_budget_mb", &config->models.memory_budget_mb);
      Read(models, "request_timeout_ms", &config->models.request_timeout_ms);
      Read(models, "default_max_concurrency", &config->models.default_max_concurrency);
      Read(models, "default_max_queue", &config->models.default_max_queue);
      Read(models, "priority_ordering", &config->models.priority_ordering);
      if (models["catalog"] && models["catalog"].IsSequence()) {
        for (const auto& model_node : models["catalog"]) {
          config->models.catalog.push_back(ParseModel(model_node));
        }
      }
      if (models["routes"] && models["routes"].IsMap()) {
        for (const auto& route : models["routes"]) {
          config->models.routes[route.first.as<std::string>()] =
              route.second.as<std::string>();
        }
      }
    }

    if (auto logging = root["logging"]) {
      Read(logging, "format", &config->logging.format);
      Read(logging, "level", &config->logging.level);
      Read(logging, "audit_log", &config->logging.audit_log);
      Read(logging, "redact_client_ip", &config->logging.redact_client_ip);
    }
  } catch (const YAML::Exception& e) {
    if (error) {
      *error = e.what();
    }
    return false;
  }
  return true;
}

bool LoadGatewayConfig(const std::string& path, GatewayConfig* config,
                       std::string* error) {
  if (path.empty() || !std::filesystem::exists(path)) {
    log::Warn("config", "config file not found; using defaults", "path=" + path);
    return true;
  }
  std::ifstream in(path);
  if (!in.is_open()) {
    if (error) {
      *error = "cannot open " + path;
    }
    return false;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  if (!ParseGatewayConfig(buf.str(), config, error)) {
    if (error) {
      *error = path + ": " + *error;
    }
    return false;
  }
  return true;
}

void ApplyEnvOverrides(GatewayConfig* config, const EnvLookup& env) {
  OverrideString(env, "MODELGATE_HOST", &config->server.host);
  OverrideNumber(env, "MODELGATE_PORT", &config->server.port);
  OverrideNumber(env, "MODELGATE_HTTP_WORKERS", &config->server.workers);
  OverrideBool(env, "MODELGATE_TLS_ENABLED", &config->server.tls_enabled);
  OverrideString(env, "MODELGATE_TLS_CERT_PATH", &config->server.tls_cert_path);
  OverrideString(env, "MODELGATE_TLS_KEY_PATH", &config->server.tls_key_path);

  OverrideString(env, "MODELGATE_KEY_STORE", &config->auth.store_path);
  OverrideString(env, "MODELGATE_KEY_STORE_PASSPHRASE", &config->auth.passphrase);
  OverrideNumber(env, "MODELGATE_RATE_LIMIT", &config->auth.default_rate_limit);
  OverrideNumber(env, "MODELGATE_RATE_WINDOW_SECONDS", &config->auth.window_seconds);
  OverrideString(env, "MODELGATE_RATE_LIMIT_SCOPE", &config->auth.rate_limit_scope);

  OverrideNumber(env, "MODELGATE_MEMORY_BUDGET_MB", &config->models.memory_budget_mb);
  OverrideNumber(env, "MODELGATE_REQUEST_TIMEOUT_MS", &config->models.request_timeout_ms);

  OverrideString(env, "MODELGATE_LOG_FORMAT", &config->logging.format);
  OverrideString(env, "MODELGATE_LOG_LEVEL", &config->logging.level);
  OverrideString(env, "MODELGATE_AUDIT_LOG", &config->logging.audit_log);

  if (auto keys = env("MODELGATE_API_KEYS")) {
    for (auto& key : ParseApiKeysEnv(*keys)) {
      config->auth.api_keys.push_back(std::move(key));
    }
  }
}

std::vector<StaticKeyConfig> ParseApiKeysEnv(const std::string& value) {
  std::vector<StaticKeyConfig> keys;
  for (const auto& entry : SplitOn(value, ',')) {
    StaticKeyConfig key;
    key.owner = "env";
    auto colon = entry.find(':');
    if (colon == std::string::npos) {
      key.key = entry;
      key.capabilities = {"*"};
    } else {
      key.key = Trim(entry.substr(0, colon));
      key.capabilities = SplitOn(entry.substr(colon + 1), '|');
    }
    if (!key.key.empty()) {
      keys.push_back(std::move(key));
    }
  }
  return keys;
}

std::vector<std::string> ValidateStaticKeys(const GatewayConfig& config) {
  std::vector<std::string> problems;
  std::map<std::string, std::string> owners_by_id;
  for (const auto& entry : config.auth.api_keys) {
    auto id = KeyRegistry::KeyId(entry.key);
    if (entry.key.size() < KeyRegistry::kMinStaticKeyLength) {
      problems.push_back("key=" + id + " owner=" + entry.owner + " shorter than " +
                         std::to_string(KeyRegistry::kMinStaticKeyLength) + " characters");
      continue;
    }
    std::set<Capability> capabilities;
    std::string unknown;
    if (!ParseCapabilities(entry.capabilities, &capabilities, &unknown)) {
      problems.push_back("key=" + id + " owner=" + entry.owner + " unknown capability " +
                         unknown);
    } else if (capabilities.empty()) {
      problems.push_back("key=" + id + " owner=" + entry.owner + " has no capabilities");
    }
    auto [it, inserted] = owners_by_id.emplace(id, entry.owner);
    if (!inserted) {
      problems.push_back("key=" + id + " owner=" + entry.owner +
                         " shares its key id with owner=" + it->second);
    }
  }
  return problems;
}

ModelCatalog BuildCatalog(const GatewayConfig& config) {
  ModelCatalog catalog;
  for (const auto& spec : config.models.catalog) {
    catalog.Add(spec);
  }
  for (const auto& [task, model_id] : config.models.routes) {
    catalog.SetRoute(task, model_id);
  }
  return catalog;
}

}  // namespace modelgate
