#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace modelgate {

// One finished request as written to the usage log.
struct RequestAuditEntry {
  std::string key_id;  // public key prefix, empty when authentication failed
  std::string method;
  std::string path;
  int status{0};
  double latency_ms{0};
  std::string client_ip;
  std::string model;       // empty for requests that never reached a model
  std::string error_code;  // empty on success
};

class AuditLogger {
 public:
  AuditLogger() = default;

  // path: JSON-lines file, appended to. redact_client_ip: write the SHA-256 of
  // the client address instead of the address itself.
  explicit AuditLogger(const std::string& path, bool redact_client_ip = false);

  bool Enabled() const { return stream_.is_open(); }

  void LogRequest(const RequestAuditEntry& entry);

  // Key and model administration: who did what to which target, and whether
  // it worked.
  void LogAdmin(const std::string& actor,
                const std::string& action,
                const std::string& target,
                const std::string& outcome);

  // Hash a string to its SHA-256 hex representation (64 chars).
  static std::string HashContent(const std::string& content);

 private:
  void Write(const std::string& line);

  std::ofstream stream_;
  std::mutex mutex_;
  bool redact_client_ip_{false};
};

}  // namespace modelgate
