#pragma once

#include <cstddef>
#include <string>

namespace jdguard {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message", with control
// characters escaped (\n, \r, \t, \xHH) so an entry never spans lines.
// Call from main() based on JDGUARD_LOG_FORMAT=json before any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Parses "debug", "info", "warn"/"warning", "error" (case-insensitive).
// Returns false and leaves `level` untouched for anything else.
bool ParseLevel(const std::string &text, Level *level);
const char *LevelName(Level level);

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "guardrails", "ratelimit", "backend").  `extra` is an optional
// key=value string appended to the JSON object or the text line (ignored when
// empty).
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

// Clips `text` to at most `max_chars` bytes for log output, appending "..."
// when something was cut.
std::string Preview(const std::string &text, std::size_t max_chars = 100);

} // namespace log
} // namespace jdguard
