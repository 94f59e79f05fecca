#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>

using json = nlohmann::json;

namespace threadrunner {
namespace log {

namespace {

std::atomic<bool> g_json_mode{false};
std::atomic<int> g_min_level{static_cast<int>(Level::INFO)};
std::atomic<bool> g_stderr_enabled{true};
std::mutex g_mutex;

// File sink state, guarded by g_mutex.
std::filesystem::path g_file_dir;
std::string g_file_prefix;
std::string g_file_date;
std::filesystem::path g_file_path;
std::ofstream g_file;

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

std::tm LocalTime(std::time_t t) {
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

std::string DateStamp(std::time_t t) {
  char buf[16];
  auto tm = LocalTime(t);
  std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
  return buf;
}

std::string TimeStamp(std::time_t t) {
  char buf[32];
  auto tm = LocalTime(t);
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return buf;
}

// Requires g_mutex.
bool OpenFileLocked(const std::string &date) {
  g_file.close();
  g_file.clear();
  g_file_path = g_file_dir / (g_file_prefix + "." + date);
  g_file.open(g_file_path, std::ios::app);
  g_file_date = date;
  return g_file.is_open();
}

} // namespace

void SetJsonMode(bool enabled) { g_json_mode.store(enabled); }
bool IsJsonMode() { return g_json_mode.load(); }

void SetMinLevel(Level level) { g_min_level.store(static_cast<int>(level)); }
Level MinLevel() { return static_cast<Level>(g_min_level.load()); }

std::optional<Level> ParseLevel(const std::string &text) {
  std::string lowered = text;
  std::transform(
      lowered.begin(), lowered.end(), lowered.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "debug" || lowered == "trace") {
    return Level::DEBUG;
  }
  if (lowered == "info") {
    return Level::INFO;
  }
  if (lowered == "warn" || lowered == "warning") {
    return Level::WARN;
  }
  if (lowered == "error") {
    return Level::ERROR;
  }
  return std::nullopt;
}

void SetStderrEnabled(bool enabled) { g_stderr_enabled.store(enabled); }

bool SetLogFile(const std::filesystem::path &dir, const std::string &prefix) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return false;
  }
  std::lock_guard<std::mutex> lock(g_mutex);
  g_file_dir = dir;
  g_file_prefix = prefix;
  if (!OpenFileLocked(DateStamp(std::time(nullptr)))) {
    g_file_path.clear();
    g_file_date.clear();
    return false;
  }
  return true;
}

std::filesystem::path CurrentLogFile() {
  std::lock_guard<std::mutex> lock(g_mutex);
  return g_file.is_open() ? g_file_path : std::filesystem::path{};
}

void CloseLogFile() {
  std::lock_guard<std::mutex> lock(g_mutex);
  g_file.close();
  g_file_path.clear();
  g_file_date.clear();
}

void Log(Level level, const std::string &component, const std::string &message,
         const std::string &extra) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  auto now = std::chrono::system_clock::now();
  auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();
  auto now_t = std::chrono::system_clock::to_time_t(now);

  std::string line;
  if (g_json_mode.load()) {
    json j;
    j["ts"] = ts;
    j["level"] = LevelString(level);
    j["component"] = component;
    j["message"] = message;
    if (!extra.empty()) {
      j["extra"] = extra;
    }
    line = j.dump(-1, ' ', false, json::error_handler_t::replace);
  } else {
    line = std::string("[") + LevelString(level) + "] " + component + ": " +
           message;
    if (!extra.empty()) {
      line += " | " + extra;
    }
  }

  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_stderr_enabled.load()) {
    std::cerr << line << "\n";
  }
  if (g_file.is_open()) {
    auto date = DateStamp(now_t);
    if (date != g_file_date && !OpenFileLocked(date)) {
      return;
    }
    if (g_json_mode.load()) {
      g_file << line << "\n";
    } else {
      g_file << TimeStamp(now_t) << " " << line << "\n";
    }
    g_file.flush();
  }
}

} // namespace log
} // namespace threadrunner
