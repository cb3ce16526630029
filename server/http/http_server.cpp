#include "server/http/http_server.h"

#include "server/errors/gateway_error.h"
#include "server/logging/logger.h"
#include "server/metrics/metrics.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>

using json = nlohmann::json;

namespace modelgate {

namespace {

constexpr std::size_t kInitialBuf = 4096;
constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string Trim(const std::string& input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Transport-level failure, before any handler ran.
HttpReply TransportError(int status, const std::string& code, const std::string& message) {
  json body = {{"error",
                {{"type", ErrorKindName(ErrorKind::kValidation)},
                 {"code", code},
                 {"message", message},
                 {"retryable", false}}}};
  HttpReply reply;
  reply.status = status;
  reply.body = body.dump();
  return reply;
}

}  // namespace

std::string HttpRequest::Header(const std::string& name) const {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? std::string() : it->second;
}

std::string HttpRequest::Query(const std::string& name, const std::string& fallback) const {
  auto it = query.find(name);
  return it == query.end() ? fallback : it->second;
}

HttpServer::HttpServer(std::string host,
                       int port,
                       RequestHandler handler,
                       MetricsRegistry* metrics,
                       TlsConfig tls_config,
                       int num_workers,
                       std::size_t max_body_bytes)
    : host_(std::move(host)),
      port_(port),
      handler_(std::move(handler)),
      metrics_(metrics),
      max_body_bytes_(max_body_bytes),
      num_workers_(num_workers > 0 ? num_workers : 4) {
  if (tls_config.enabled) {
    if (tls_config.cert_path.empty() || tls_config.key_path.empty()) {
      log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    } else {
      SSL_load_error_strings();
      OpenSSL_add_ssl_algorithms();
      ssl_ctx_ = SSL_CTX_new(TLS_server_method());
      if (!ssl_ctx_) {
        log::Error("http", "failed to initialize TLS context");
      } else {
        SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
        if (SSL_CTX_use_certificate_file(ssl_ctx_, tls_config.cert_path.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
          log::Error("http", "failed to load TLS certificate", "path=" + tls_config.cert_path);
          SSL_CTX_free(ssl_ctx_);
          ssl_ctx_ = nullptr;
        } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_, tls_config.key_path.c_str(),
                                               SSL_FILETYPE_PEM) <= 0) {
          log::Error("http", "failed to load TLS key", "path=" + tls_config.key_path);
          SSL_CTX_free(ssl_ctx_);
          ssl_ctx_ = nullptr;
        } else {
          tls_enabled_ = true;
          log::Info("http", "TLS enabled", "cert=" + tls_config.cert_path);
        }
      }
    }
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

bool HttpServer::Start() {
  if (running_) {
    return true;
  }
  if (!Bind()) {
    return false;
  }
  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
  return true;
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto& w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

bool HttpServer::Bind() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::string("error=") + std::strerror(errno));
    return false;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    log::Error("http", "invalid listen address", "host=" + host_);
    ::close(fd);
    return false;
  }

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed",
               "host=" + host_ + " port=" + std::to_string(port_) +
                   " error=" + std::strerror(errno));
    ::close(fd);
    return false;
  }
  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::string("error=") + std::strerror(errno));
    ::close(fd);
    return false;
  }
  server_fd_.store(fd);
  return true;
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  const int fd = server_fd_.load();
  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd = ::accept(fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client_fd < 0) {
      if (errno == EINTR && running_) {
        continue;
      }
      break;  // Socket closed by Stop() or error.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    char peer[INET_ADDRSTRLEN] = {0};
    if (::inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer))) {
      session.peer = peer;
    }
    if (tls_enabled_) {
      SSL* ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession& session) {
  struct ConnectionGuard {
    MetricsRegistry* metrics;
    ~ConnectionGuard() {
      if (metrics) {
        metrics->DecrementConnections();
      }
    }
  } guard{metrics_};
  if (metrics_) {
    metrics_->IncrementConnections();
  }

  // Phase 1: read until the end-of-headers marker.
  std::string request;
  request.resize(kInitialBuf);
  std::size_t total = 0;
  std::size_t header_end = std::string::npos;
  while (header_end == std::string::npos) {
    if (total >= request.size()) {
      request.resize(request.size() * 2);
    }
    ssize_t bytes = Receive(session, &request[total], request.size() - total);
    if (bytes <= 0) {
      return;
    }
    total += static_cast<std::size_t>(bytes);
    header_end = std::string(request.data(), total).find("\r\n\r\n");
    if (header_end == std::string::npos && total > kMaxHeaderBytes) {
      SendAll(session, SerializeReply(TransportError(431, "headers_too_large",
                                                     "request headers too large")));
      return;
    }
  }

  HttpRequest parsed;
  if (!ParseRequestHead(request.substr(0, header_end), &parsed)) {
    SendAll(session,
            SerializeReply(TransportError(400, "malformed_request", "malformed HTTP request")));
    return;
  }
  parsed.client_ip = session.peer;

  // Phase 2: read the body announced by Content-Length.
  std::size_t content_length = 0;
  auto cl = parsed.Header("content-length");
  if (!cl.empty()) {
    try {
      content_length = static_cast<std::size_t>(std::stoull(cl));
    } catch (const std::exception&) {
      SendAll(session, SerializeReply(TransportError(400, "malformed_request",
                                                     "invalid Content-Length")));
      return;
    }
  }
  if (content_length > max_body_bytes_) {
    SendAll(session, SerializeReply(TransportError(413, "payload_too_large",
                                                   "request body too large")));
    return;
  }
  const std::size_t body_start = header_end + 4;
  const std::size_t needed = body_start + content_length;
  if (request.size() < needed) {
    request.resize(needed);
  }
  while (total < needed) {
    ssize_t bytes = Receive(session, &request[total], needed - total);
    if (bytes <= 0) {
      return;
    }
    total += static_cast<std::size_t>(bytes);
  }
  parsed.body = request.substr(body_start, content_length);

  HttpReply reply;
  try {
    reply = handler_(parsed);
  } catch (const std::exception& ex) {
    log::Error("http", "request handler raised",
               "method=" + parsed.method + " path=" + parsed.path + " error=" + ex.what());
    json body = {{"error",
                  {{"type", ErrorKindName(ErrorKind::kBackend)},
                   {"code", "internal_error"},
                   {"message", "internal server error"},
                   {"retryable", false}}}};
    reply.status = 500;
    reply.content_type = "application/json";
    reply.body = body.dump();
    reply.headers.clear();
  }
  SendAll(session, SerializeReply(reply));
}

bool HttpServer::ParseRequestHead(const std::string& head, HttpRequest* request) {
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos) {
    return false;
  }
  auto target_end = first_line.find(' ', method_end + 1);
  if (target_end == std::string::npos) {
    return false;
  }
  request->method = first_line.substr(0, method_end);
  std::string target = first_line.substr(method_end + 1, target_end - method_end - 1);
  if (request->method.empty() || target.empty() || target[0] != '/') {
    return false;
  }

  auto qpos = target.find('?');
  request->path = UrlDecode(target.substr(0, qpos));
  request->query.clear();
  if (qpos != std::string::npos) {
    std::string qs = target.substr(qpos + 1);
    std::size_t start = 0;
    while (start <= qs.size()) {
      auto amp = qs.find('&', start);
      std::string pair = qs.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
      if (!pair.empty()) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
          request->query[UrlDecode(pair, true)] = "";
        } else {
          request->query[UrlDecode(pair.substr(0, eq), true)] =
              UrlDecode(pair.substr(eq + 1), true);
        }
      }
      if (amp == std::string::npos) {
        break;
      }
      start = amp + 1;
    }
  }

  request->headers.clear();
  std::size_t pos = first_line_end == std::string::npos ? head.size() : first_line_end + 2;
  while (pos < head.size()) {
    auto end = head.find("\r\n", pos);
    std::string line = head.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    pos = end == std::string::npos ? head.size() : end + 2;
    if (line.empty()) {
      continue;
    }
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      return false;
    }
    request->headers[ToLower(Trim(line.substr(0, colon)))] = Trim(line.substr(colon + 1));
  }
  return true;
}

std::string HttpServer::SerializeReply(const HttpReply& reply) {
  std::string out = "HTTP/1.1 " + std::to_string(reply.status) + " " +
                    HttpStatusText(reply.status) + "\r\n";
  if (!reply.content_type.empty() && reply.status != 204) {
    out += "Content-Type: " + reply.content_type + "\r\n";
  }
  out += "Access-Control-Allow-Origin: *\r\n";
  for (const auto& [name, value] : reply.headers) {
    out += name + ": " + value + "\r\n";
  }
  out += "Connection: close\r\n";
  out += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n\r\n";
  return out + reply.body;
}

std::string HttpServer::UrlDecode(const std::string& text, bool plus_as_space) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '%' && i + 2 < text.size()) {
      int hi = HexValue(text[i + 1]);
      int lo = HexValue(text[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(plus_as_space && text[i] == '+' ? ' ' : text[i]);
  }
  return out;
}

bool HttpServer::SendAll(ClientSession& session, const std::string& payload) {
  const char* data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession& session, char* buffer, std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession& session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

}  // namespace modelgate
