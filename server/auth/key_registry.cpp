#include "server/auth/key_registry.h"

#include "server/logging/logger.h"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace modelgate {

namespace {
constexpr const char* kKeyPrefix = "mg_";
constexpr int kCreateAttempts = 8;

struct CapabilityNameEntry {
  Capability capability;
  const char* name;
};

constexpr std::array<CapabilityNameEntry, 6> kCapabilityNames{{
    {Capability::kGenerate, "generate"},
    {Capability::kTranscribe, "transcribe"},
    {Capability::kEmbed, "embed"},
    {Capability::kOcr, "ocr"},
    {Capability::kBusiness, "business"},
    {Capability::kAdmin, "admin"},
}};

GatewayError InvalidKey() {
  return GatewayError::Auth("invalid_api_key", "invalid API key");
}

GatewayError StoreUnavailable(const std::string& action) {
  return GatewayError::Backend("key store write failed; " + action);
}

GatewayError CheckUsable(const ApiKeyRecord& record, int64_t now) {
  if (!record.Active()) {
    return GatewayError::Auth("revoked_api_key", "API key has been revoked");
  }
  if (record.Expired(now)) {
    return GatewayError::Auth("expired_api_key", "API key has expired");
  }
  return GatewayError::Ok();
}
}  // namespace

const char* CapabilityName(Capability capability) {
  for (const auto& entry : kCapabilityNames) {
    if (entry.capability == capability) {
      return entry.name;
    }
  }
  return "unknown";
}

bool ParseCapability(const std::string& name, Capability* capability) {
  for (const auto& entry : kCapabilityNames) {
    if (name == entry.name) {
      *capability = entry.capability;
      return true;
    }
  }
  return false;
}

std::vector<Capability> AllCapabilities() {
  std::vector<Capability> all;
  for (const auto& entry : kCapabilityNames) {
    all.push_back(entry.capability);
  }
  return all;
}

bool ParseCapabilities(const std::vector<std::string>& names,
                       std::set<Capability>* out,
                       std::string* unknown) {
  for (const auto& name : names) {
    if (name == "*" || name == "all") {
      for (auto cap : AllCapabilities()) {
        out->insert(cap);
      }
      continue;
    }
    Capability cap;
    if (!ParseCapability(name, &cap)) {
      if (unknown) {
        *unknown = name;
      }
      return false;
    }
    out->insert(cap);
  }
  return true;
}

std::vector<std::string> CapabilityNames(const std::set<Capability>& capabilities) {
  std::vector<std::string> names;
  for (auto cap : capabilities) {
    names.emplace_back(CapabilityName(cap));
  }
  return names;
}

KeyRegistry::KeyRegistry(std::shared_ptr<KeyStoreBackend> store, WallClock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

std::string KeyRegistry::HashKey(const std::string& raw_key) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(raw_key.data()), raw_key.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

std::string KeyRegistry::KeyId(const std::string& raw_key) {
  return raw_key.substr(0, std::min(raw_key.size(), kIdLength));
}

std::string KeyRegistry::GenerateRawKey() {
  std::array<unsigned char, 32> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  // 32 bytes -> 44 base64 characters including one '=' of padding.
  std::array<unsigned char, 45> encoded{};
  int len = EVP_EncodeBlock(encoded.data(), bytes.data(), static_cast<int>(bytes.size()));
  std::string token(reinterpret_cast<const char*>(encoded.data()), static_cast<std::size_t>(len));
  for (auto& c : token) {
    if (c == '+') c = '-';
    if (c == '/') c = '_';
  }
  token.erase(std::remove(token.begin(), token.end(), '='), token.end());
  return kKeyPrefix + token;
}

int64_t KeyRegistry::Now() const {
  if (clock_) {
    return clock_();
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::shared_ptr<KeyRegistry::Entry> KeyRegistry::Find(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second;
}

bool KeyRegistry::Insert(std::shared_ptr<Entry> entry) {
  std::unique_lock lock(mutex_);
  // The id is a prefix of the raw key, so a unique id also means a unique digest.
  return entries_.emplace(entry->record.id, std::move(entry)).second;
}

void KeyRegistry::Erase(const std::string& id) {
  std::unique_lock lock(mutex_);
  entries_.erase(id);
}

// On failure the record stays staged in the store; the next successful Save
// (write-through or FlushUsage) makes it durable.
bool KeyRegistry::Persist(const ApiKeyRecord& record) {
  if (!store_ || record.is_static) {
    return true;
  }
  std::lock_guard<std::mutex> lock(store_mutex_);
  store_->Upsert(record);
  if (!store_->Save()) {
    log::Error("key_registry", "failed to persist key store", "key=" + record.id);
    return false;
  }
  return true;
}

bool KeyRegistry::LoadFromStore(std::size_t* loaded) {
  std::size_t count = 0;
  if (loaded) {
    *loaded = 0;
  }
  if (!store_) {
    return true;
  }
  if (!store_->Load()) {
    return false;
  }
  for (auto& record : store_->Records()) {
    auto entry = std::make_shared<Entry>();
    entry->record = std::move(record);
    entry->record.is_static = false;
    auto id = entry->record.id;
    if (!Insert(std::move(entry))) {
      log::Warn("key_registry", "duplicate key id in store; keeping first", "key=" + id);
      continue;
    }
    ++count;
  }
  if (loaded) {
    *loaded = count;
  }
  return true;
}

GatewayError KeyRegistry::AddStaticKey(const std::string& raw_key,
                                       const std::string& owner,
                                       const std::set<Capability>& capabilities,
                                       const RateLimitPolicy& rate_limit,
                                       int priority) {
  if (raw_key.size() < kMinStaticKeyLength) {
    return GatewayError::Validation("static API keys must be at least " +
                                    std::to_string(kMinStaticKeyLength) + " characters");
  }
  if (capabilities.empty()) {
    return GatewayError::Validation("static API key has no capabilities");
  }
  auto entry = std::make_shared<Entry>();
  entry->record.id = KeyId(raw_key);
  entry->record.digest = HashKey(raw_key);
  entry->record.owner = owner.empty() ? "config" : owner;
  entry->record.capabilities = capabilities;
  entry->record.rate_limit = rate_limit;
  entry->record.priority = priority;
  entry->record.is_static = true;
  entry->record.created_at = Now();
  if (!Insert(entry)) {
    return GatewayError::Validation("API key id '" + KeyId(raw_key) +
                                    "' collides with an existing key");
  }
  return GatewayError::Ok();
}

GatewayError KeyRegistry::Authenticate(const std::string& raw_key, ApiKeyRecord* record) {
  if (raw_key.empty()) {
    return GatewayError::Auth("missing_api_key", "missing API key");
  }
  if (raw_key.size() < kIdLength) {
    return InvalidKey();
  }
  auto entry = Find(KeyId(raw_key));
  auto digest = HashKey(raw_key);
  if (!entry) {
    return InvalidKey();
  }
  auto now = Now();
  std::lock_guard<std::mutex> lock(entry->mutex);
  const auto& stored = entry->record.digest;
  if (stored.size() != digest.size() ||
      CRYPTO_memcmp(stored.data(), digest.data(), digest.size()) != 0) {
    return InvalidKey();
  }
  if (auto err = CheckUsable(entry->record, now)) {
    return err;
  }
  entry->record.authentications++;
  entry->record.last_used_at = now;
  entry->changes++;
  if (record) {
    *record = entry->record;
  }
  return GatewayError::Ok();
}

GatewayError KeyRegistry::Authorize(const ApiKeyRecord& record, Capability capability) {
  auto entry = Find(record.id);
  if (!entry) {
    return InvalidKey();
  }
  auto now = Now();
  std::lock_guard<std::mutex> lock(entry->mutex);
  // Re-check the live record: the key may have been revoked since Authenticate.
  if (auto err = CheckUsable(entry->record, now)) {
    return err;
  }
  entry->changes++;
  if (!entry->record.Has(capability)) {
    entry->record.denials++;
    return GatewayError::PermissionDenied(
        "missing_capability",
        std::string("API key lacks the '") + CapabilityName(capability) + "' capability");
  }
  entry->record.authorizations++;
  return GatewayError::Ok();
}

GatewayError KeyRegistry::Create(const KeyCreateRequest& request, ApiKeyRecord* record,
                                 std::string* raw_key) {
  if (request.owner.empty()) {
    return GatewayError::Validation("owner is required");
  }
  if (request.capabilities.empty()) {
    return GatewayError::Validation("at least one capability is required");
  }
  auto now = Now();
  if (request.expires_at != 0 && request.expires_at <= now) {
    return GatewayError::Validation("expiry must be in the future");
  }
  for (int attempt = 0; attempt < kCreateAttempts; ++attempt) {
    std::string candidate = GenerateRawKey();
    auto entry = std::make_shared<Entry>();
    entry->record.id = KeyId(candidate);
    entry->record.digest = HashKey(candidate);
    entry->record.owner = request.owner;
    entry->record.description = request.description;
    entry->record.capabilities = request.capabilities;
    entry->record.rate_limit = request.rate_limit;
    entry->record.priority = request.priority;
    entry->record.created_at = now;
    entry->record.expires_at = request.expires_at;
    ApiKeyRecord snapshot = entry->record;
    if (!Insert(std::move(entry))) {
      log::Debug("key_registry", "key id collision, regenerating");
      continue;
    }
    if (!Persist(snapshot)) {
      // The raw key would not survive a restart, so it is never handed out.
      Erase(snapshot.id);
      std::lock_guard<std::mutex> lock(store_mutex_);
      store_->Remove(snapshot.id);
      return StoreUnavailable("key not created");
    }
    log::Info("key_registry", "created API key", "key=" + snapshot.id + " owner=" + snapshot.owner);
    if (record) {
      *record = snapshot;
    }
    if (raw_key) {
      *raw_key = std::move(candidate);
    }
    return GatewayError::Ok();
  }
  return GatewayError::Backend("could not allocate a unique key id");
}

GatewayError KeyRegistry::SetStatus(const std::string& id, KeyStatus status) {
  auto entry = Find(id);
  if (!entry) {
    return GatewayError::NotFound("API key not found");
  }
  ApiKeyRecord snapshot;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->record.status = status;
    entry->changes++;
    snapshot = entry->record;
  }
  if (snapshot.is_static) {
    log::Warn("key_registry", "status change on a static key is not persisted", "key=" + id);
  }
  // The new status stays in effect in memory either way; the entry remains
  // dirty so FlushUsage retries the write.
  if (!Persist(snapshot)) {
    return StoreUnavailable(status == KeyStatus::kRevoked
                                ? "revocation applied in memory only"
                                : "activation applied in memory only");
  }
  log::Info("key_registry",
            status == KeyStatus::kRevoked ? "revoked API key" : "activated API key",
            "key=" + id);
  return GatewayError::Ok();
}

GatewayError KeyRegistry::Revoke(const std::string& id) {
  return SetStatus(id, KeyStatus::kRevoked);
}

GatewayError KeyRegistry::Activate(const std::string& id) {
  return SetStatus(id, KeyStatus::kActive);
}

GatewayError KeyRegistry::Update(const std::string& id, const KeyUpdateRequest& update,
                                 ApiKeyRecord* record) {
  if (update.capabilities && update.capabilities->empty()) {
    return GatewayError::Validation("at least one capability is required");
  }
  auto entry = Find(id);
  if (!entry) {
    return GatewayError::NotFound("API key not found");
  }
  ApiKeyRecord snapshot;
  {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (update.capabilities) {
      entry->record.capabilities = *update.capabilities;
    }
    if (update.rate_limit) {
      entry->record.rate_limit = *update.rate_limit;
    }
    if (update.description) {
      entry->record.description = *update.description;
    }
    if (update.priority) {
      entry->record.priority = *update.priority;
    }
    entry->changes++;
    snapshot = entry->record;
  }
  if (record) {
    *record = snapshot;
  }
  if (!Persist(snapshot)) {
    return StoreUnavailable("update applied in memory only");
  }
  return GatewayError::Ok();
}

void KeyRegistry::RecordRequest(const std::string& id, const std::string& endpoint) {
  auto entry = Find(id);
  if (!entry) {
    return;
  }
  auto now = Now();
  std::lock_guard<std::mutex> lock(entry->mutex);
  auto& record = entry->record;
  record.requests++;
  record.endpoints.insert(endpoint);
  if (record.first_request_at == 0) {
    record.first_request_at = now;
  }
  record.last_request_at = now;
  entry->changes++;
}

GatewayError KeyRegistry::Get(const std::string& id, ApiKeyRecord* record) const {
  auto entry = Find(id);
  if (!entry) {
    return GatewayError::NotFound("API key not found");
  }
  std::lock_guard<std::mutex> lock(entry->mutex);
  *record = entry->record;
  return GatewayError::Ok();
}

std::vector<ApiKeyRecord> KeyRegistry::List(bool active_only) const {
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::shared_lock lock(mutex_);
    entries.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      entries.push_back(entry);
    }
  }
  auto now = Now();
  std::vector<ApiKeyRecord> out;
  out.reserve(entries.size());
  for (const auto& entry : entries) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (active_only && (!entry->record.Active() || entry->record.Expired(now))) {
      continue;
    }
    out.push_back(entry->record);
  }
  std::sort(out.begin(), out.end(), [](const ApiKeyRecord& a, const ApiKeyRecord& b) {
    if (a.created_at != b.created_at) {
      return a.created_at < b.created_at;
    }
    return a.id < b.id;
  });
  return out;
}

KeyRegistryStats KeyRegistry::Stats() const {
  KeyRegistryStats stats;
  auto now = Now();
  for (const auto& record : List(false)) {
    stats.total++;
    if (!record.Active()) {
      stats.revoked++;
    } else if (record.Expired(now)) {
      stats.expired++;
    } else {
      stats.active++;
    }
    stats.authentications += record.authentications;
    stats.authorizations += record.authorizations;
    stats.denials += record.denials;
  }
  return stats;
}

bool KeyRegistry::HasKeys() const {
  std::shared_lock lock(mutex_);
  return !entries_.empty();
}

bool KeyRegistry::FlushUsage() {
  if (!store_) {
    return true;
  }
  std::vector<std::shared_ptr<Entry>> entries;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [id, entry] : entries_) {
      entries.push_back(entry);
    }
  }
  std::vector<std::pair<std::shared_ptr<Entry>, uint64_t>> pending;
  std::lock_guard<std::mutex> store_lock(store_mutex_);
  for (const auto& entry : entries) {
    ApiKeyRecord snapshot;
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      if (entry->changes == entry->flushed || entry->record.is_static) {
        continue;
      }
      snapshot = entry->record;
      pending.emplace_back(entry, entry->changes);
    }
    store_->Upsert(snapshot);
  }
  if (pending.empty()) {
    return true;
  }
  if (!store_->Save()) {
    log::Error("key_registry", "failed to flush key usage counters",
               "keys=" + std::to_string(pending.size()));
    return false;
  }
  // Changes made after the snapshot keep the entry dirty.
  for (const auto& [entry, changes] : pending) {
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->flushed = std::max(entry->flushed, changes);
  }
  log::Debug("key_registry", "flushed key usage", "keys=" + std::to_string(pending.size()));
  return true;
}

}  // namespace modelgate
