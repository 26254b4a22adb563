#pragma once

#include <string>

namespace decodeflux {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line to stderr).
// Default mode is plain text: "[LEVEL] component: message".
// The CLI calls this when DECODEFLUX_LOG_FORMAT=json before any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped. Defaults to INFO; verbose runs lower it
// to DEBUG.
void SetMinLevel(Level level);
Level MinLevel();

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "session_state", "text_generation").  `extra` is an optional
// key=value string appended to the JSON object or the text line (ignored
// when empty).
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

// Parse "debug" / "info" / "warn" / "error" (case-insensitive).  Returns
// false and leaves `out` untouched for anything else.
bool ParseLevel(const std::string &name, Level &out);

} // namespace log
} // namespace decodeflux
