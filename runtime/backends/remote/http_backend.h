#pragma once

#include "net/http_client.h"
#include "runtime/backends/inference_backend.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace modelgate {

// Forwards operations to an inference engine running as a separate HTTP
// service (llama.cpp server, whisper.cpp server, an OCR sidecar, ...).
//
// Options:
//   health_path   GET checked by Load(); empty skips the check (default /health)
//   timeout_ms    per-call socket timeout (default 120000)
//   api_key       sent as "Authorization: Bearer <key>" when set
//   operations    comma-separated list reported by Operations()
//
// Invoke(op, input) POSTs input as JSON to <endpoint>/<op>. A 4xx answer is
// the caller's fault (std::invalid_argument); anything else that is not 2xx,
// or a transport failure, is a std::runtime_error.
class HttpBackend : public InferenceBackend {
public:
  bool Load(const ModelSpec &spec, std::string *error) override;
  void Unload() override;
  bool IsReady() const override { return ready_.load(); }
  nlohmann::json Invoke(const std::string &operation,
                        const nlohmann::json &input) override;
  std::vector<std::string> Operations() const override { return operations_; }
  std::string Name() const override { return "http"; }

private:
  std::string Url(const std::string &suffix) const;
  std::map<std::string, std::string> Headers() const;

  std::string endpoint_;
  std::string api_key_;
  std::vector<std::string> operations_;
  std::unique_ptr<HttpClient> client_;
  std::atomic<bool> ready_{false};
};

} // namespace modelgate
