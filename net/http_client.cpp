#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace modelgate {
namespace {
struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string path{"/"};
  int port{80};
  bool use_tls{false};
};

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = Lower(url.substr(0, scheme_pos));
    remainder = url.substr(scheme_pos + 3);
  }
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::runtime_error("unsupported URL scheme: " + parsed.scheme);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find('/');
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  parsed.path = slash == std::string::npos ? "/" : remainder.substr(slash);

  auto colon = host_port.rfind(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception &) {
      throw std::runtime_error("invalid URL port");
    }
  }
  if (parsed.host.empty()) {
    throw std::runtime_error("invalid URL host");
  }
  return parsed;
}

// Owns the socket and, for https, the SSL session of one request.
class Connection {
public:
  Connection(const ParsedUrl &parsed, int timeout_ms, SSL_CTX *ctx) {
    // The destructor does not run for a throwing constructor.
    try {
      Open(parsed, timeout_ms, ctx);
    } catch (const std::exception &) {
      Close();
      throw;
    }
  }

  ~Connection() { Close(); }

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  void Open(const ParsedUrl &parsed, int timeout_ms, SSL_CTX *ctx) {
    Connect(parsed, timeout_ms);
    if (!parsed.use_tls) {
      return;
    }
    if (!ctx) {
      throw std::runtime_error("TLS not available in HttpClient");
    }
    ssl_ = SSL_new(ctx);
    if (!ssl_) {
      throw std::runtime_error("failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(ssl_, parsed.host.c_str());
#if defined(SSL_set1_host)
    SSL_set1_host(ssl_, parsed.host.c_str());
#endif
    SSL_set_fd(ssl_, sock_);
    if (SSL_connect(ssl_) != 1) {
      throw std::runtime_error("TLS handshake failed");
    }
    if (SSL_get_verify_result(ssl_) != X509_V_OK) {
      throw std::runtime_error("TLS certificate verification failed");
    }
  }

  void Close() {
    if (ssl_) {
      SSL_shutdown(ssl_);
      SSL_free(ssl_);
      ssl_ = nullptr;
    }
    if (sock_ >= 0) {
      ::close(sock_);
      sock_ = -1;
    }
  }

  void SendAll(const std::string &payload) {
    const char *ptr = payload.data();
    std::size_t remaining = payload.size();
    while (remaining > 0) {
      long sent = ssl_ ? SSL_write(ssl_, ptr, static_cast<int>(remaining))
                       : ::send(sock_, ptr, remaining, MSG_NOSIGNAL);
      if (sent < 0 && !ssl_ && errno == EINTR) {
        continue;
      }
      if (sent <= 0) {
        throw std::runtime_error("failed to send request");
      }
      ptr += sent;
      remaining -= static_cast<std::size_t>(sent);
    }
  }

  std::string ReceiveAll() {
    std::string response;
    char buffer[4096];
    for (;;) {
      long got = ssl_ ? SSL_read(ssl_, buffer, sizeof(buffer))
                      : ::recv(sock_, buffer, sizeof(buffer), 0);
      if (got > 0) {
        response.append(buffer, static_cast<std::size_t>(got));
        continue;
      }
      if (got < 0 && !ssl_ && errno == EINTR) {
        continue;
      }
      if (got < 0 && response.empty()) {
        throw std::runtime_error("failed to read response");
      }
      break;
    }
    return response;
  }

private:
  void Connect(const ParsedUrl &parsed, int timeout_ms) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo *result = nullptr;
    if (getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                    &hints, &result) != 0) {
      throw std::runtime_error("failed to resolve host " + parsed.host);
    }
    for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
      sock_ = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
      if (sock_ == -1)
        continue;
      if (::connect(sock_, rp->ai_addr, rp->ai_addrlen) == 0)
        break;
      ::close(sock_);
      sock_ = -1;
    }
    freeaddrinfo(result);
    if (sock_ == -1) {
      throw std::runtime_error("failed to connect to " + parsed.host + ":" +
                               std::to_string(parsed.port));
    }
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  }

  int sock_{-1};
  SSL *ssl_{nullptr};
};

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body,
                         const std::map<std::string, std::string> &headers) {
  std::ostringstream request;
  request << method << " " << parsed.path << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host << "\r\n";
  bool has_content_type = false;
  for (const auto &[key, value] : headers) {
    if (Lower(key) == "content-type")
      has_content_type = true;
    request << key << ": " << value << "\r\n";
  }
  if (!body.empty() || method == "POST") {
    request << "Content-Length: " << body.size() << "\r\n";
    if (!has_content_type)
      request << "Content-Type: application/json\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

std::string DecodeChunked(const std::string &body) {
  std::string out;
  std::size_t pos = 0;
  while (pos < body.size()) {
    auto line_end = body.find("\r\n", pos);
    if (line_end == std::string::npos)
      break;
    std::size_t size = 0;
    try {
      size = std::stoul(body.substr(pos, line_end - pos), nullptr, 16);
    } catch (const std::exception &) {
      break;
    }
    if (size == 0)
      break;
    pos = line_end + 2;
    out.append(body, pos, std::min(size, body.size() - pos));
    pos += size + 2;
  }
  return out;
}
} // namespace

std::string HttpResponse::Header(const std::string &name) const {
  auto it = headers.find(Lower(name));
  return it == headers.end() ? std::string() : it->second;
}

HttpClient::HttpClient(int timeout_ms) : timeout_ms_(timeout_ms) {
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse
HttpClient::Get(const std::string &url,
                const std::map<std::string, std::string> &headers) const {
  return Send("GET", url, "", headers);
}

HttpResponse
HttpClient::Post(const std::string &url, const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  return Send("POST", url, body, headers);
}

HttpResponse
HttpClient::Delete(const std::string &url,
                   const std::map<std::string, std::string> &headers) const {
  return Send("DELETE", url, "", headers);
}

HttpResponse
HttpClient::Send(const std::string &method, const std::string &url,
                 const std::string &body,
                 const std::map<std::string, std::string> &headers) const {
  auto parsed = ParseUrl(url);
  Connection conn(parsed, timeout_ms_, ssl_ctx_);
  conn.SendAll(BuildRequest(parsed, method, body, headers));
  auto raw = conn.ReceiveAll();
  if (raw.empty()) {
    throw std::runtime_error("empty response from " + parsed.host);
  }
  return ParseResponse(raw);
}

HttpResponse HttpClient::ParseResponse(const std::string &raw) {
  HttpResponse http_response;
  auto header_end = raw.find("\r\n\r\n");
  std::string head =
      header_end == std::string::npos ? raw : raw.substr(0, header_end);
  std::string body = header_end == std::string::npos
                         ? std::string()
                         : raw.substr(header_end + 4);

  std::istringstream lines(head);
  std::string status_line;
  std::getline(lines, status_line);
  auto status_pos = status_line.find(' ');
  if (status_pos != std::string::npos) {
    try {
      http_response.status = std::stoi(status_line.substr(status_pos + 1));
    } catch (const std::exception &) {
      http_response.status = 0;
    }
  }
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    auto colon = line.find(':');
    if (colon == std::string::npos)
      continue;
    auto value = line.substr(colon + 1);
    auto start = value.find_first_not_of(' ');
    http_response.headers[Lower(line.substr(0, colon))] =
        start == std::string::npos ? std::string() : value.substr(start);
  }
  if (Lower(http_response.Header("transfer-encoding")) == "chunked") {
    body = DecodeChunked(body);
  }
  http_response.body = std::move(body);
  return http_response;
}

} // namespace modelgate
