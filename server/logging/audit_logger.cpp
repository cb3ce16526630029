#include "server/logging/audit_logger.h"

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

#include <chrono>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace modelgate {

namespace {
int64_t UnixNow() {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}
}  // namespace

AuditLogger::AuditLogger(const std::string& path, bool redact_client_ip)
    : redact_client_ip_(redact_client_ip) {
  if (!path.empty()) {
    stream_.open(path, std::ios::app);
  }
}

std::string AuditLogger::HashContent(const std::string& content) {
  unsigned char hash[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(content.data()), content.size(), hash);
  std::ostringstream hex;
  hex << std::hex << std::setfill('0');
  for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    hex << std::setw(2) << static_cast<int>(hash[i]);
  }
  return hex.str();
}

void AuditLogger::LogRequest(const RequestAuditEntry& entry) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = UnixNow();
  j["event"] = "request";
  j["key_id"] = entry.key_id;
  j["method"] = entry.method;
  j["path"] = entry.path;
  j["status"] = entry.status;
  j["latency_ms"] = static_cast<int64_t>(entry.latency_ms + 0.5);
  if (redact_client_ip_) {
    // Stable pseudonym: the same client still correlates across lines.
    j["client_ip_sha256"] = HashContent(entry.client_ip);
  } else {
    j["client_ip"] = entry.client_ip;
  }
  if (!entry.model.empty()) {
    j["model"] = entry.model;
  }
  if (!entry.error_code.empty()) {
    j["error"] = entry.error_code;
  }
  Write(j.dump());
}

void AuditLogger::LogAdmin(const std::string& actor,
                           const std::string& action,
                           const std::string& target,
                           const std::string& outcome) {
  if (!Enabled()) {
    return;
  }
  json j;
  j["timestamp"] = UnixNow();
  j["event"] = "admin";
  j["actor"] = actor;
  j["action"] = action;
  j["target"] = target;
  j["outcome"] = outcome;
  Write(j.dump());
}

void AuditLogger::Write(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << line << "\n";
  stream_.flush();
}

}  // namespace modelgate
