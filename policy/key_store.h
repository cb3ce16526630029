#pragma once

#include "policy/key_store_backend.h"

#include <array>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace modelgate {

// INI-style key file, one section per key:
//
//   [key mg_3Jq9xZt0a]
//   digest=<sha256 hex>
//   owner=billing-service
//   capabilities=embed,business
//   rate_limit=60/60
//   status=active
//   ...
//
// With a passphrase the whole file is sealed with AES-256-GCM
// (key = SHA-256(passphrase)) and written as "ENC\nnonce=..\ntag=..\ndata=..".
class FileKeyStore : public KeyStoreBackend {
 public:
  explicit FileKeyStore(std::string path, std::string passphrase = "");

  bool Load() override;
  bool Save() const override;

  std::vector<ApiKeyRecord> Records() const override;
  void Upsert(const ApiKeyRecord& record) override;
  void Remove(const std::string& id) override;

  std::string Name() const override { return "file"; }
  const std::string& Path() const { return path_; }
  bool Encrypted() const { return encryption_enabled_; }

 private:
  std::string path_;
  mutable std::mutex mutex_;
  std::map<std::string, ApiKeyRecord> records_;
  bool encryption_enabled_{false};
  std::array<unsigned char, 32> key_{};

  void EnsureParentDir() const;
  std::string Serialize() const;
  void Parse(const std::string& plaintext);
  bool Encrypt(const std::string& plaintext, std::string* output) const;
  bool Decrypt(const std::string& encrypted, std::string* plaintext) const;
};

}  // namespace modelgate
