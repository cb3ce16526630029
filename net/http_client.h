#pragma once

#include <map>
#include <string>

#include <openssl/ssl.h>

namespace modelgate {

struct HttpResponse {
  int status{0};
  std::string body;
  std::map<std::string, std::string> headers; // lowercased names

  std::string Header(const std::string &name) const;
  bool Ok() const { return status >= 200 && status < 300; }
};

// Blocking HTTP/1.1 client, one connection per request ("Connection: close").
// https:// URLs are verified against the system trust store. Transport
// failures throw std::runtime_error; any HTTP status is returned as-is.
class HttpClient {
public:
  explicit HttpClient(int timeout_ms = 30000);
  ~HttpClient();
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse
  Get(const std::string &url,
      const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Post(const std::string &url, const std::string &body,
       const std::map<std::string, std::string> &headers = {}) const;
  HttpResponse
  Delete(const std::string &url,
         const std::map<std::string, std::string> &headers = {}) const;

  // Splits a raw response into status, headers and body; decodes
  // "Transfer-Encoding: chunked" bodies.
  static HttpResponse ParseResponse(const std::string &raw);

private:
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body,
                    const std::map<std::string, std::string> &headers) const;

  int timeout_ms_;
  SSL_CTX *ssl_ctx_{nullptr};
};

} // namespace modelgate
