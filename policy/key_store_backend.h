#pragma once

#include "server/auth/api_key_record.h"

#include <string>
#include <vector>

namespace modelgate {

// KeyStoreBackend is the plugin interface for durable API key storage.
// The registry keeps the live copy in memory and writes through this
// interface after admin mutations and on periodic usage flushes.
//
// Revocation is a status change so the audit history survives. Remove only
// drops a record that was staged by Upsert but never made durable.
//
// Thread safety: all methods must be safe to call concurrently.
class KeyStoreBackend {
 public:
  virtual ~KeyStoreBackend() = default;

  // Lifecycle
  virtual bool Load() = 0;
  virtual bool Save() const = 0;

  virtual std::vector<ApiKeyRecord> Records() const = 0;
  virtual void Upsert(const ApiKeyRecord& record) = 0;
  virtual void Remove(const std::string& id) = 0;

  // Identity, for logging and diagnostics.
  virtual std::string Name() const = 0;
};

}  // namespace modelgate
