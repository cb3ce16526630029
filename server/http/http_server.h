#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/types.h>

#include <openssl/ssl.h>

namespace modelgate {

class MetricsRegistry;

struct HttpRequest {
  std::string method;
  std::string path;  // without the query string
  std::map<std::string, std::string> query;
  std::map<std::string, std::string> headers;  // lowercase names
  std::string body;
  std::string client_ip;

  // Case-insensitive; empty when absent.
  std::string Header(const std::string& name) const;
  std::string Query(const std::string& name, const std::string& fallback = {}) const;
};

struct HttpReply {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
  std::vector<std::pair<std::string, std::string>> headers;
};

using RequestHandler = std::function<HttpReply(const HttpRequest&)>;

// Thread-pool HTTP/1.1 server: one accept thread hands connections to
// num_workers workers, each serving one request per connection. Optional
// in-process TLS via OpenSSL.
class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  HttpServer(std::string host,
             int port,
             RequestHandler handler,
             MetricsRegistry* metrics,
             TlsConfig tls_config,
             int num_workers = 4,
             std::size_t max_body_bytes = 32 * 1024 * 1024);
  ~HttpServer();

  // Returns false when the socket could not be bound.
  bool Start();
  void Stop();
  bool TlsEnabled() const { return tls_enabled_; }

  // Parses the request line and headers (everything before the blank line).
  static bool ParseRequestHead(const std::string& head, HttpRequest* request);
  static std::string SerializeReply(const HttpReply& reply);
  // Only query strings encode a space as '+'; in a path it is literal.
  static std::string UrlDecode(const std::string& text, bool plus_as_space = false);

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
    std::string peer;
  };

  bool Bind();
  void Run();
  void WorkerLoop();
  void HandleClient(ClientSession& session);

  bool SendAll(ClientSession& session, const std::string& payload);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  std::string host_;
  int port_;
  RequestHandler handler_;
  MetricsRegistry* metrics_;
  std::size_t max_body_bytes_;
  bool tls_enabled_{false};
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

}  // namespace modelgate
