#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace threadrunner {
namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

// Enable JSON-structured output (one JSON object per line).
// Default mode is plain text: "[LEVEL] component: message".
// Call from main() based on THREADRUNNER_LOG_FORMAT=json before any logging.
void SetJsonMode(bool enabled);
bool IsJsonMode();

// Entries below `level` are dropped. Default is INFO.
void SetMinLevel(Level level);
Level MinLevel();

// Parses "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<Level> ParseLevel(const std::string &text);

// Toggle the stderr sink (enabled by default).
void SetStderrEnabled(bool enabled);

// Append entries to a daily rolling file <dir>/<prefix>.YYYY-MM-DD. The file
// is reopened when the local date changes. Returns false if the directory
// cannot be created or the file cannot be opened.
bool SetLogFile(const std::filesystem::path &dir, const std::string &prefix);

// Path of the file currently written, empty when the file sink is off.
std::filesystem::path CurrentLogFile();

// Disable the file sink and close the file.
void CloseLogFile();

// Emit a log entry at the given level.  `component` identifies the subsystem
// (e.g. "daemon", "connection", "backend").  `extra` is an optional key=value
// string appended to the JSON object or the text line (ignored when empty).
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
} // namespace threadrunner
