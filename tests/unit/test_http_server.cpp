#include <catch2/catch.hpp>

#include "net/http_client.h"
#include "server/http/http_server.h"
#include "server/metrics/metrics.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace modelgate;

TEST_CASE("ParseRequestHead splits method, path, query and headers", "[http]") {
  HttpRequest request;
  REQUIRE(HttpServer::ParseRequestHead(
      "GET /admin/keys/list?active_only=true&note=a%20b+c HTTP/1.1\r\n"
      "Host: localhost\r\n"
      "X-API-Key:  mg_secret \r\n"
      "Content-Length: 0",
      &request));
  REQUIRE(request.method == "GET");
  REQUIRE(request.path == "/admin/keys/list");
  REQUIRE(request.Query("active_only") == "true");
  REQUIRE(request.Query("note") == "a b c");
  REQUIRE(request.Query("missing", "dflt") == "dflt");
  REQUIRE(request.Header("x-api-key") == "mg_secret");
  REQUIRE(request.Header("X-Api-Key") == "mg_secret");
  REQUIRE(request.Header("authorization").empty());
}

TEST_CASE("ParseRequestHead keeps flag-style query parameters", "[http]") {
  HttpRequest request;
  REQUIRE(HttpServer::ParseRequestHead("POST /transcribe?timestamps&language=en HTTP/1.1",
                                       &request));
  REQUIRE(request.query.count("timestamps") == 1);
  REQUIRE(request.Query("timestamps").empty());
  REQUIRE(request.Query("language") == "en");
}

TEST_CASE("ParseRequestHead rejects malformed heads", "[http]") {
  HttpRequest request;
  REQUIRE_FALSE(HttpServer::ParseRequestHead("GARBAGE", &request));
  REQUIRE_FALSE(HttpServer::ParseRequestHead("GET nopath HTTP/1.1", &request));
  REQUIRE_FALSE(HttpServer::ParseRequestHead("GET / HTTP/1.1\r\nno-colon-here", &request));
}

TEST_CASE("UrlDecode handles escapes, plus and stray percent signs", "[http]") {
  REQUIRE(HttpServer::UrlDecode("a%2Fb") == "a/b");
  REQUIRE(HttpServer::UrlDecode("one+two", true) == "one two");
  REQUIRE(HttpServer::UrlDecode("100%") == "100%");
  REQUIRE(HttpServer::UrlDecode("%zz") == "%zz");
}

TEST_CASE("ParseRequestHead keeps plus signs in the path", "[http]") {
  REQUIRE(HttpServer::UrlDecode("one+two") == "one+two");

  HttpRequest request;
  REQUIRE(HttpServer::ParseRequestHead(
      "DELETE /admin/models/llm:phi+mini?note=a+b HTTP/1.1", &request));
  REQUIRE(request.path == "/admin/models/llm:phi+mini");
  REQUIRE(request.Query("note") == "a b");

  REQUIRE(HttpServer::ParseRequestHead("GET /models/llm%2B2 HTTP/1.1", &request));
  REQUIRE(request.path == "/models/llm+2");
}

TEST_CASE("SerializeReply writes status line, headers and body", "[http]") {
  HttpReply reply;
  reply.status = 429;
  reply.body = "{}";
  reply.headers.push_back({"Retry-After", "12"});
  auto wire = HttpServer::SerializeReply(reply);
  REQUIRE(wire.rfind("HTTP/1.1 429 Too Many Requests\r\n", 0) == 0);
  REQUIRE(wire.find("Content-Type: application/json\r\n") != std::string::npos);
  REQUIRE(wire.find("Retry-After: 12\r\n") != std::string::npos);
  REQUIRE(wire.find("Content-Length: 2\r\n\r\n{}") != std::string::npos);

  HttpReply empty;
  empty.status = 204;
  auto no_content = HttpServer::SerializeReply(empty);
  REQUIRE(no_content.find("Content-Type") == std::string::npos);
  REQUIRE(no_content.find("Content-Length: 0") != std::string::npos);
}

TEST_CASE("HttpClient ParseResponse decodes chunked bodies", "[http]") {
  auto resp = HttpClient::ParseResponse(
      "HTTP/1.1 200 OK\r\n"
      "Content-Type: application/json\r\n"
      "Transfer-Encoding: chunked\r\n\r\n"
      "4\r\n{\"a\"\r\n"
      "3\r\n:1}\r\n"
      "0\r\n\r\n");
  REQUIRE(resp.status == 200);
  REQUIRE(resp.Ok());
  REQUIRE(resp.Header("content-type") == "application/json");
  REQUIRE(resp.body == "{\"a\":1}");
}

TEST_CASE("HttpServer serves requests over loopback", "[http][integration]") {
  constexpr int kPort = 18471;
  MetricsRegistry metrics;
  HttpServer server(
      "127.0.0.1", kPort,
      [](const HttpRequest &request) {
        if (request.path == "/boom") {
          throw std::runtime_error("handler failure");
        }
        HttpReply reply;
        reply.body = nlohmann::json({{"method", request.method},
                                     {"path", request.path},
                                     {"body", request.body},
                                     {"key", request.Header("x-api-key")},
                                     {"client_ip", request.client_ip}})
                         .dump();
        return reply;
      },
      &metrics, HttpServer::TlsConfig{}, 2, 1024);
  REQUIRE(server.Start());
  REQUIRE_FALSE(server.TlsEnabled());

  HttpClient client(2000);
  const std::string base = "http://127.0.0.1:" + std::to_string(kPort);

  auto echo = client.Post(base + "/embeddings", "{\"texts\":[\"a\"]}",
                          {{"X-API-Key", "mg_test"}});
  REQUIRE(echo.status == 200);
  auto body = nlohmann::json::parse(echo.body);
  REQUIRE(body["method"] == "POST");
  REQUIRE(body["path"] == "/embeddings");
  REQUIRE(body["body"] == "{\"texts\":[\"a\"]}");
  REQUIRE(body["key"] == "mg_test");
  REQUIRE(body["client_ip"] == "127.0.0.1");

  auto too_large = client.Post(base + "/embeddings", std::string(2048, 'x'));
  REQUIRE(too_large.status == 413);
  REQUIRE(nlohmann::json::parse(too_large.body)["error"]["code"] == "payload_too_large");

  auto failed = client.Get(base + "/boom");
  REQUIRE(failed.status == 500);
  REQUIRE(nlohmann::json::parse(failed.body)["error"]["code"] == "internal_error");

  server.Stop();
  REQUIRE_THROWS_AS(client.Get(base + "/after-stop"), std::runtime_error);
}
