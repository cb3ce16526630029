#include "runtime/backends/remote/http_backend.h"

#include "server/logging/logger.h"

#include <sstream>
#include <stdexcept>

namespace modelgate {

namespace {

constexpr int kDefaultTimeoutMs = 120000;
constexpr std::size_t kMaxErrorDetail = 200;

std::vector<std::string> SplitList(const std::string &csv) {
  std::vector<std::string> out;
  std::stringstream ss(csv);
  std::string item;
  while (std::getline(ss, item, ',')) {
    auto start = item.find_first_not_of(' ');
    auto end = item.find_last_not_of(' ');
    if (start != std::string::npos)
      out.push_back(item.substr(start, end - start + 1));
  }
  return out;
}

// Pulls a short human message out of an upstream error body.
std::string ErrorDetail(const HttpResponse &resp) {
  auto parsed = nlohmann::json::parse(resp.body, nullptr, false);
  std::string detail;
  if (!parsed.is_discarded() && parsed.is_object()) {
    if (parsed.contains("error") && parsed["error"].is_string()) {
      detail = parsed["error"].get<std::string>();
    } else if (parsed.contains("error") && parsed["error"].is_object() &&
               parsed["error"].contains("message") &&
               parsed["error"]["message"].is_string()) {
      detail = parsed["error"]["message"].get<std::string>();
    } else if (parsed.contains("detail") && parsed["detail"].is_string()) {
      detail = parsed["detail"].get<std::string>();
    }
  }
  if (detail.empty())
    detail = resp.body;
  if (detail.size() > kMaxErrorDetail)
    detail = detail.substr(0, kMaxErrorDetail);
  return detail;
}

} // namespace

bool HttpBackend::Load(const ModelSpec &spec, std::string *error) {
  if (spec.endpoint.empty()) {
    if (error)
      *error = "endpoint is required for provider=http";
    return false;
  }
  endpoint_ = spec.endpoint;
  while (!endpoint_.empty() && endpoint_.back() == '/')
    endpoint_.pop_back();
  api_key_ = spec.Option("api_key");
  operations_ = SplitList(spec.Option("operations"));

  int timeout_ms = kDefaultTimeoutMs;
  auto timeout = spec.Option("timeout_ms");
  if (!timeout.empty()) {
    try {
      timeout_ms = std::stoi(timeout);
    } catch (const std::exception &) {
      if (error)
        *error = "invalid timeout_ms option: " + timeout;
      return false;
    }
  }
  client_ = std::make_unique<HttpClient>(timeout_ms);

  auto health_path = spec.Option("health_path", "/health");
  if (!health_path.empty()) {
    try {
      auto resp = client_->Get(Url(health_path), Headers());
      if (!resp.Ok()) {
        if (error)
          *error = "health check returned HTTP " + std::to_string(resp.status);
        client_.reset();
        return false;
      }
    } catch (const std::exception &ex) {
      if (error)
        *error = std::string("health check failed: ") + ex.what();
      client_.reset();
      return false;
    }
  }
  ready_.store(true);
  log::Info("http_backend", "connected", "model=" + spec.id + " endpoint=" + endpoint_);
  return true;
}

void HttpBackend::Unload() {
  ready_.store(false);
  client_.reset();
}

std::string HttpBackend::Url(const std::string &suffix) const {
  if (!suffix.empty() && suffix.front() == '/')
    return endpoint_ + suffix;
  return endpoint_ + "/" + suffix;
}

std::map<std::string, std::string> HttpBackend::Headers() const {
  std::map<std::string, std::string> headers;
  if (!api_key_.empty())
    headers["Authorization"] = "Bearer " + api_key_;
  return headers;
}

nlohmann::json HttpBackend::Invoke(const std::string &operation,
                                   const nlohmann::json &input) {
  if (!ready_.load() || !client_) {
    throw std::runtime_error("remote backend is not loaded");
  }
  auto resp = client_->Post(Url(operation), input.dump(), Headers());
  if (resp.status >= 400 && resp.status < 500) {
    throw std::invalid_argument(ErrorDetail(resp));
  }
  if (!resp.Ok()) {
    throw std::runtime_error("upstream returned HTTP " + std::to_string(resp.status));
  }
  auto parsed = nlohmann::json::parse(resp.body, nullptr, false);
  if (parsed.is_discarded()) {
    throw std::runtime_error("upstream returned invalid JSON");
  }
  return parsed;
}

} // namespace modelgate
