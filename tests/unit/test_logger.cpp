#include <catch2/catch.hpp>

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

namespace {

namespace log = modelgate::log;

// Redirects std::cerr for the lifetime of the object.
class CaptureStderr {
public:
  CaptureStderr() : old_(std::cerr.rdbuf(buffer_.rdbuf())) {}
  ~CaptureStderr() { std::cerr.rdbuf(old_); }
  std::string str() const { return buffer_.str(); }

private:
  std::ostringstream buffer_;
  std::streambuf *old_;
};

// Restores the global logger state after each test.
struct LoggerReset {
  ~LoggerReset() {
    log::SetJsonMode(false);
    log::SetLevel(log::Level::INFO);
  }
};

} // namespace

TEST_CASE("Logger defaults to plain text at INFO", "[logger]") {
  LoggerReset reset;
  REQUIRE_FALSE(log::IsJsonMode());
  REQUIRE(log::CurrentLevel() == log::Level::INFO);
}

TEST_CASE("Logger writes text lines with component and extra", "[logger]") {
  LoggerReset reset;
  CaptureStderr capture;
  log::Warn("slots", "model evicted", "model=embedding:small");
  log::Info("server", "listening");
  REQUIRE(capture.str() ==
          "[WARN] slots: model evicted | model=embedding:small\n"
          "[INFO] server: listening\n");
}

TEST_CASE("Logger writes one JSON object per line in JSON mode", "[logger]") {
  LoggerReset reset;
  log::SetJsonMode(true);
  CaptureStderr capture;
  log::Error("admission", "queue full", "model=llm:mistral");

  auto line = capture.str();
  REQUIRE(line.back() == '\n');
  auto j = nlohmann::json::parse(line);
  REQUIRE(j["level"] == "ERROR");
  REQUIRE(j["component"] == "admission");
  REQUIRE(j["message"] == "queue full");
  REQUIRE(j["extra"] == "model=llm:mistral");
  REQUIRE(j["fields"]["model"] == "llm:mistral");
  REQUIRE(j["ts"].is_number_integer());
}

TEST_CASE("Logger JSON fields skip tokens without a value", "[logger]") {
  LoggerReset reset;
  log::SetJsonMode(true);
  CaptureStderr capture;
  log::Info("slots", "model loaded", "model=embedding:small  load_ms=12 warm");
  auto j = nlohmann::json::parse(capture.str());
  REQUIRE(j["fields"].size() == 2);
  REQUIRE(j["fields"]["load_ms"] == "12");
  REQUIRE(j["fields"].count("warm") == 0);
}

TEST_CASE("Logger masks raw API keys", "[logger]") {
  REQUIRE(log::ScrubSecrets("key=mg_AbCdEfGhIjKlMnOp rest") == "key=mg_AbCdEfGhI*** rest");
  // A bare key id is already public.
  REQUIRE(log::ScrubSecrets("actor=mg_AbCdEfGhI") == "actor=mg_AbCdEfGhI");
  REQUIRE(log::ScrubSecrets("no secrets here") == "no secrets here");

  LoggerReset reset;
  CaptureStderr capture;
  log::Warn("auth", "rejected mg_0123456789abcdef", "raw=mg_0123456789abcdefXYZ");
  REQUIRE(capture.str() == "[WARN] auth: rejected mg_012345678*** | raw=mg_012345678***\n");
}

TEST_CASE("Logger drops entries below the level threshold", "[logger]") {
  LoggerReset reset;
  log::SetLevel(log::Level::WARN);
  CaptureStderr capture;
  log::Debug("test", "hidden");
  log::Info("test", "hidden too");
  log::Warn("test", "shown");
  REQUIRE(capture.str() == "[WARN] test: shown\n");
}

TEST_CASE("Logger ParseLevel accepts level names case-insensitively", "[logger]") {
  log::Level level;
  REQUIRE(log::ParseLevel("DEBUG", &level));
  REQUIRE(level == log::Level::DEBUG);
  REQUIRE(log::ParseLevel("warning", &level));
  REQUIRE(level == log::Level::WARN);
  REQUIRE(log::ParseLevel("Error", &level));
  REQUIRE(level == log::Level::ERROR);
  REQUIRE_FALSE(log::ParseLevel("verbose", &level));
}

TEST_CASE("Logger lines do not interleave under concurrent writers", "[logger]") {
  LoggerReset reset;
  CaptureStderr capture;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([t] {
      for (int i = 0; i < 50; ++i) {
        log::Info("worker" + std::to_string(t), "tick");
      }
    });
  }
  for (auto &th : threads) {
    th.join();
  }
  std::istringstream lines(capture.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    REQUIRE(line.rfind("[INFO] worker", 0) == 0);
    REQUIRE(line.substr(line.size() - 6) == ": tick");
    ++count;
  }
  REQUIRE(count == 200);
}
