#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iostream>
#include <mutex>

using json = nlohmann::json;

namespace modelgate {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::mutex g_mutex;

// Raw keys are "mg_" + 43 base64url characters; only the first 12 (the public
// key id) may reach a log line.
constexpr std::size_t kKeyIdLength = 12;
constexpr const char *kKeyPrefix = "mg_";

bool IsKeyChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

const char *LevelString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARN:
    return "WARN";
  case Level::ERROR:
    return "ERROR";
  }
  return "UNKNOWN";
}

// "model=llm:a key=mg_x" -> {"model": "llm:a", "key": "mg_x"}. Tokens without
// '=' are skipped; the raw string is still logged as "extra".
json ParseFields(const std::string &extra) {
  json fields = json::object();
  std::size_t pos = 0;
  while (pos < extra.size()) {
    while (pos < extra.size() && extra[pos] == ' ')
      ++pos;
    auto end = extra.find(' ', pos);
    if (end == std::string::npos)
      end = extra.size();
    auto token = extra.substr(pos, end - pos);
    auto eq = token.find('=');
    if (eq != std::string::npos && eq > 0)
      fields[token.substr(0, eq)] = token.substr(eq + 1);
    pos = end;
  }
  return fields;
}

} // namespace

std::string ScrubSecrets(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  for (;;) {
    auto hit = text.find(kKeyPrefix, pos);
    if (hit == std::string::npos) {
      out.append(text, pos, std::string::npos);
      return out;
    }
    auto end = hit;
    while (end < text.size() && IsKeyChar(text[end]))
      ++end;
    out.append(text, pos, hit - pos);
    if (end - hit > kKeyIdLength) {
      out.append(text, hit, kKeyIdLength);
      out += "***";
    } else {
      out.append(text, hit, end - hit);
    }
    pos = end;
  }
}

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level CurrentLevel() { return static_cast<Level>(g_min_level.load()); }

bool ParseLevel(const std::string &text, Level *level) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug") {
    *level = Level::DEBUG;
  } else if (lowered == "info") {
    *level = Level::INFO;
  } else if (lowered == "warn" || lowered == "warning") {
    *level = Level::WARN;
  } else if (lowered == "error") {
    *level = Level::ERROR;
  } else {
    return false;
  }
  return true;
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_min_level.load(std::memory_order_relaxed)) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  const auto text = ScrubSecrets(message);
  const auto details = ScrubSecrets(extra);

  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelString(level);
    j["component"] = component;
    j["message"] = text;
    if (!details.empty()) {
      j["extra"] = details;
      auto fields = ParseFields(details);
      if (!fields.empty()) {
        j["fields"] = std::move(fields);
      }
    }
    line = j.dump();
  } else {
    line = std::string("[") + LevelString(level) + "] " + component + ": " +
           text;
    if (!details.empty()) {
      line += " | " + details;
    }
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  std::cerr << line << "\n";
}

} // namespace log
} // namespace modelgate
