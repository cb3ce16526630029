#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace modelgate {

enum class Capability { kGenerate, kTranscribe, kEmbed, kOcr, kBusiness, kAdmin };

const char* CapabilityName(Capability capability);
bool ParseCapability(const std::string& name, Capability* capability);
std::vector<Capability> AllCapabilities();

// Parses names into a set; "*" or "all" expands to every capability.
// Returns false on the first unknown name and stores it in *unknown.
bool ParseCapabilities(const std::vector<std::string>& names,
                       std::set<Capability>* out,
                       std::string* unknown = nullptr);
std::vector<std::string> CapabilityNames(const std::set<Capability>& capabilities);

// N requests per rolling window of W seconds; max_requests <= 0 disables.
struct RateLimitPolicy {
  int max_requests{60};
  int window_seconds{60};

  bool Unlimited() const { return max_requests <= 0 || window_seconds <= 0; }
};

enum class KeyStatus { kActive, kRevoked };

struct ApiKeyRecord {
  std::string id;      // public key prefix, safe to log and display
  std::string digest;  // SHA-256 hex of the raw key
  std::string owner;
  std::string description;
  std::set<Capability> capabilities;
  RateLimitPolicy rate_limit;
  int priority{0};  // admission queue priority, higher first
  KeyStatus status{KeyStatus::kActive};
  bool is_static{false};  // from configuration, never persisted

  int64_t created_at{0};    // unix seconds
  int64_t expires_at{0};    // 0 = never
  int64_t last_used_at{0};

  uint64_t authentications{0};
  uint64_t authorizations{0};
  uint64_t denials{0};

  // Requests that passed authentication, whatever their outcome.
  uint64_t requests{0};
  std::set<std::string> endpoints;  // route labels seen
  int64_t first_request_at{0};
  int64_t last_request_at{0};

  bool Active() const { return status == KeyStatus::kActive; }
  bool Expired(int64_t now) const { return expires_at > 0 && now >= expires_at; }
  bool Has(Capability capability) const { return capabilities.count(capability) > 0; }
};

}  // namespace modelgate
