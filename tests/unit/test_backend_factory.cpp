#include <catch2/catch.hpp>

#include "runtime/backends/backend_factory.h"
#include "runtime/backends/remote/http_backend.h"

#include <stdexcept>

using namespace modelgate;

namespace {

ModelSpec Spec(const std::string &kind, const std::string &provider = "builtin") {
  ModelSpec spec;
  spec.id = kind + ":test";
  spec.kind = kind;
  spec.provider = provider;
  return spec;
}

} // namespace

TEST_CASE("BackendFactory creates a built-in backend per kind",
          "[backend_factory]") {
  for (const auto &kind : BackendFactory::BuiltinKinds()) {
    INFO("kind=" << kind);
    auto backend = BackendFactory::Create(Spec(kind));
    REQUIRE(backend != nullptr);
    REQUIRE_FALSE(backend->IsReady());
    REQUIRE(BackendFactory::KnownKind(kind));
  }
}

TEST_CASE("BackendFactory returns the HTTP backend for provider http",
          "[backend_factory]") {
  auto backend = BackendFactory::Create(Spec("llm", "http"));
  REQUIRE(backend != nullptr);
  REQUIRE(backend->Name() == "http");
}

TEST_CASE("BackendFactory rejects unknown kinds and providers",
          "[backend_factory]") {
  REQUIRE(BackendFactory::Create(Spec("hologram")) == nullptr);
  REQUIRE(BackendFactory::Create(Spec("embedding", "grpc")) == nullptr);
  // llm and speech have no in-process implementation.
  REQUIRE(BackendFactory::Create(Spec("llm")) == nullptr);
  REQUIRE(BackendFactory::Create(Spec("speech")) == nullptr);
  REQUIRE(BackendFactory::KnownProvider("http"));
  REQUIRE_FALSE(BackendFactory::KnownProvider("grpc"));
}

TEST_CASE("HttpBackend requires an endpoint", "[backend_factory][http]") {
  HttpBackend backend;
  std::string error;
  REQUIRE_FALSE(backend.Load(Spec("llm", "http"), &error));
  REQUIRE(error.find("endpoint") != std::string::npos);
  REQUIRE_FALSE(backend.IsReady());
}

TEST_CASE("HttpBackend rejects invoke before load", "[backend_factory][http]") {
  HttpBackend backend;
  REQUIRE_THROWS_AS(backend.Invoke("generate", nlohmann::json::object()),
                    std::runtime_error);
}

TEST_CASE("HttpBackend reads options and reports transport failures",
          "[backend_factory][http]") {
  auto spec = Spec("ocr", "http");
  spec.endpoint = "http://127.0.0.1:1/";
  spec.options["health_path"] = "";
  spec.options["timeout_ms"] = "500";
  spec.options["operations"] = "recognize, info";

  HttpBackend backend;
  std::string error;
  REQUIRE(backend.Load(spec, &error));
  REQUIRE(backend.IsReady());
  REQUIRE(backend.Operations() == std::vector<std::string>{"recognize", "info"});
  // Nothing listens on port 1.
  REQUIRE_THROWS_AS(backend.Invoke("recognize", {{"image", "AAAA"}}),
                    std::runtime_error);
  backend.Unload();
  REQUIRE_FALSE(backend.IsReady());
}

TEST_CASE("HttpBackend fails load when the health check cannot connect",
          "[backend_factory][http]") {
  auto spec = Spec("speech", "http");
  spec.endpoint = "http://127.0.0.1:1";
  spec.options["timeout_ms"] = "500";
  HttpBackend backend;
  std::string error;
  REQUIRE_FALSE(backend.Load(spec, &error));
  REQUIRE(error.find("health check") != std::string::npos);
}

TEST_CASE("HttpBackend rejects a malformed timeout", "[backend_factory][http]") {
  auto spec = Spec("llm", "http");
  spec.endpoint = "http://127.0.0.1:1";
  spec.options["timeout_ms"] = "soon";
  HttpBackend backend;
  std::string error;
  REQUIRE_FALSE(backend.Load(spec, &error));
  REQUIRE(error.find("timeout_ms") != std::string::npos);
}
