#pragma once

#include <string>

namespace modelgate {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// Call from main() based on logging.format / MODELGATE_LOG_FORMAT before any
// logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below the threshold are dropped. Default: INFO.
void SetLevel(Level level);
Level CurrentLevel();

// Parses "debug", "info", "warn"/"warning", "error" (case-insensitive).
bool ParseLevel(const std::string &text, Level *level);

// Masks anything that looks like a raw API key down to its public id:
// "mg_abcdefghijklmnop" -> "mg_abcdefghi***".
std::string ScrubSecrets(const std::string &text);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "server", "slots", "admission").  `extra` is an optional
// space-separated key=value string: appended to the text line, or kept as
// "extra" plus a parsed "fields" object in JSON mode. Message and extra pass
// through ScrubSecrets first.
void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra = {});

// Convenience wrappers.
inline void Debug(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::DEBUG, component, message, extra);
}
inline void Info(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::INFO, component, message, extra);
}
inline void Warn(const std::string &component, const std::string &message,
                 const std::string &extra = {}) {
  Log(Level::WARN, component, message, extra);
}
inline void Error(const std::string &component, const std::string &message,
                  const std::string &extra = {}) {
  Log(Level::ERROR, component, message, extra);
}

} // namespace log
} // namespace modelgate
