#include "server/errors/gateway_error.h"

#include <utility>

namespace modelgate {

namespace {
GatewayError Make(ErrorKind kind, std::string code, std::string message) {
  GatewayError err;
  err.kind = kind;
  err.code = std::move(code);
  err.message = std::move(message);
  return err;
}
}  // namespace

GatewayError GatewayError::Auth(std::string code, std::string message) {
  return Make(ErrorKind::kAuth, std::move(code), std::move(message));
}

GatewayError GatewayError::PermissionDenied(std::string code, std::string message) {
  return Make(ErrorKind::kPermissionDenied, std::move(code), std::move(message));
}

GatewayError GatewayError::RateLimited(std::chrono::seconds retry_after) {
  auto err = Make(ErrorKind::kRateLimited, "rate_limited", "rate limit exceeded");
  err.retry_after = retry_after.count() < 1 ? std::chrono::seconds(1) : retry_after;
  return err;
}

GatewayError GatewayError::ModelUnavailable(std::string code, std::string message) {
  return Make(ErrorKind::kModelUnavailable, std::move(code), std::move(message));
}

GatewayError GatewayError::Timeout(std::string code, std::string message) {
  return Make(ErrorKind::kTimeout, std::move(code), std::move(message));
}

GatewayError GatewayError::Validation(std::string message) {
  return Make(ErrorKind::kValidation, "invalid_request", std::move(message));
}

GatewayError GatewayError::NotFound(std::string message) {
  return Make(ErrorKind::kNotFound, "not_found", std::move(message));
}

GatewayError GatewayError::Backend(std::string message) {
  return Make(ErrorKind::kBackend, "backend_error", std::move(message));
}

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kAuth:
      return "authentication_error";
    case ErrorKind::kPermissionDenied:
      return "permission_denied";
    case ErrorKind::kRateLimited:
      return "rate_limit_exceeded";
    case ErrorKind::kModelUnavailable:
      return "model_unavailable";
    case ErrorKind::kTimeout:
      return "request_timeout";
    case ErrorKind::kValidation:
      return "validation_error";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kBackend:
      return "backend_error";
  }
  return "unknown";
}

int HttpStatusFor(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return 200;
    case ErrorKind::kAuth:
      return 401;
    case ErrorKind::kPermissionDenied:
      return 403;
    case ErrorKind::kRateLimited:
      return 429;
    case ErrorKind::kModelUnavailable:
      return 503;
    case ErrorKind::kTimeout:
      return 504;
    case ErrorKind::kValidation:
      return 400;
    case ErrorKind::kNotFound:
      return 404;
    case ErrorKind::kBackend:
      return 500;
  }
  return 500;
}

const char* HttpStatusText(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 204:
      return "No Content";
    case 400:
      return "Bad Request";
    case 401:
      return "Unauthorized";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 415:
      return "Unsupported Media Type";
    case 431:
      return "Request Header Fields Too Large";
    case 429:
      return "Too Many Requests";
    case 500:
      return "Internal Server Error";
    case 503:
      return "Service Unavailable";
    case 504:
      return "Gateway Timeout";
    default:
      return "Unknown";
  }
}

bool IsRetryable(ErrorKind kind) {
  return kind == ErrorKind::kRateLimited || kind == ErrorKind::kModelUnavailable ||
         kind == ErrorKind::kTimeout;
}

}  // namespace modelgate
