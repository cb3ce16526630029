#pragma once

#include "policy/key_store_backend.h"
#include "server/auth/api_key_record.h"
#include "server/errors/gateway_error.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelgate {

struct KeyCreateRequest {
  std::string owner;
  std::string description;
  std::set<Capability> capabilities;
  RateLimitPolicy rate_limit;
  int priority{0};
  int64_t expires_at{0};  // unix seconds, 0 = never
};

struct KeyUpdateRequest {
  std::optional<std::set<Capability>> capabilities;
  std::optional<RateLimitPolicy> rate_limit;
  std::optional<std::string> description;
  std::optional<int> priority;
};

struct KeyRegistryStats {
  std::size_t total{0};
  std::size_t active{0};
  std::size_t revoked{0};
  std::size_t expired{0};
  uint64_t authentications{0};
  uint64_t authorizations{0};
  uint64_t denials{0};
};

// Holds every API key record in memory, keyed by the public id (the first
// kIdLength characters of the raw key). Raw keys are never kept: only their
// SHA-256 digest, compared in constant time.
//
// Locking: a shared mutex guards the id -> entry map; each entry has its own
// mutex for status and counters, so requests for different keys never contend.
class KeyRegistry {
 public:
  using WallClock = std::function<int64_t()>;

  static constexpr std::size_t kIdLength = 12;
  static constexpr std::size_t kMinStaticKeyLength = 16;

  explicit KeyRegistry(std::shared_ptr<KeyStoreBackend> store = nullptr,
                       WallClock clock = {});

  static std::string HashKey(const std::string& raw_key);
  static std::string KeyId(const std::string& raw_key);
  // "mg_" + 43 base64url characters from 32 CSPRNG bytes.
  static std::string GenerateRawKey();

  // Reads the store into memory. Returns false if the store failed to load.
  bool LoadFromStore(std::size_t* loaded = nullptr);
  GatewayError AddStaticKey(const std::string& raw_key,
                            const std::string& owner,
                            const std::set<Capability>& capabilities,
                            const RateLimitPolicy& rate_limit,
                            int priority = 0);

  GatewayError Authenticate(const std::string& raw_key, ApiKeyRecord* record);
  GatewayError Authorize(const ApiKeyRecord& record, Capability capability);

  // The raw key is handed back exactly once through *raw_key.
  GatewayError Create(const KeyCreateRequest& request, ApiKeyRecord* record,
                      std::string* raw_key);
  GatewayError Revoke(const std::string& id);
  GatewayError Activate(const std::string& id);
  GatewayError Update(const std::string& id, const KeyUpdateRequest& update,
                      ApiKeyRecord* record = nullptr);

  // Counts one authenticated request against the key's request log summary.
  void RecordRequest(const std::string& id, const std::string& endpoint);

  GatewayError Get(const std::string& id, ApiKeyRecord* record) const;
  std::vector<ApiKeyRecord> List(bool active_only = false) const;
  KeyRegistryStats Stats() const;
  bool HasKeys() const;
  bool Persistent() const { return store_ != nullptr; }

  // Writes records changed since the last successful flush, including
  // admin changes whose write-through failed. No-op without a store.
  bool FlushUsage();

  // Wall-clock seconds from the injected clock.
  int64_t Now() const;

 private:
  struct Entry {
    mutable std::mutex mutex;
    ApiKeyRecord record;
    // Dirty while changes != flushed.
    uint64_t changes{0};
    uint64_t flushed{0};
  };

  std::shared_ptr<Entry> Find(const std::string& id) const;
  bool Insert(std::shared_ptr<Entry> entry);
  void Erase(const std::string& id);
  bool Persist(const ApiKeyRecord& record);
  GatewayError SetStatus(const std::string& id, KeyStatus status);

  std::shared_ptr<KeyStoreBackend> store_;
  WallClock clock_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  std::mutex store_mutex_;
};

}  // namespace modelgate
