#pragma once

#include <chrono>
#include <string>

namespace modelgate {

// Failure categories surfaced to clients. Each maps to one HTTP status and one
// retry policy (see IsRetryable).
enum class ErrorKind {
  kNone,
  kAuth,              // missing, invalid, revoked or expired key
  kPermissionDenied,  // key lacks the capability
  kRateLimited,       // quota exhausted; retry_after is set
  kModelUnavailable,  // load failure, resource exhaustion, queue full
  kTimeout,           // deadline passed while waiting for a model or a slot
  kValidation,        // malformed payload
  kNotFound,          // unknown route or admin target
  kBackend,           // back-end raised during Invoke
};

struct GatewayError {
  ErrorKind kind{ErrorKind::kNone};
  std::string code;     // stable machine-readable code, e.g. "resource_exhausted"
  std::string message;  // human readable, never carries digests or internals
  std::chrono::seconds retry_after{0};

  bool ok() const { return kind == ErrorKind::kNone; }
  explicit operator bool() const { return kind != ErrorKind::kNone; }

  static GatewayError Ok() { return {}; }
  static GatewayError Auth(std::string code, std::string message);
  static GatewayError PermissionDenied(std::string code, std::string message);
  static GatewayError RateLimited(std::chrono::seconds retry_after);
  static GatewayError ModelUnavailable(std::string code, std::string message);
  static GatewayError Timeout(std::string code, std::string message);
  static GatewayError Validation(std::string message);
  static GatewayError NotFound(std::string message);
  static GatewayError Backend(std::string message);
};

const char* ErrorKindName(ErrorKind kind);
int HttpStatusFor(ErrorKind kind);
const char* HttpStatusText(int status);

// Explicit retry policy: rate limits, unavailable models and timeouts may be
// retried by the client later; everything else needs a client-side fix.
bool IsRetryable(ErrorKind kind);

}  // namespace modelgate
