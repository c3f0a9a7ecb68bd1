#pragma once

#include <array>
#include <cstddef>
#include <cstdio>
#include <format>
#include <string>
#include <string_view>
#include <utility>

// Minimal stderr logger. Lines look like "warn: physics: body 12 is stale".
namespace Log {

enum class Level : std::size_t {
  Debug,
  Info,
  Warn,
  Error,
};

inline constexpr std::size_t kLevelCount = 4;

inline Level& minLevel() {
  static Level level = Level::Info;
  return level;
}

inline void setMinLevel(Level level) {
  minLevel() = level;
}

inline std::array<int, kLevelCount>& counters() {
  static std::array<int, kLevelCount> counts{};
  return counts;
}

// Counts every call, including ones filtered out by minLevel().
inline int count(Level level) {
  return counters()[static_cast<std::size_t>(level)];
}

inline void resetCounts() {
  counters().fill(0);
}

inline std::string_view levelName(Level level) {
  switch (level) {
    case Level::Debug:
      return "debug";
    case Level::Info:
      return "info";
    case Level::Warn:
      return "warn";
    case Level::Error:
      return "error";
  }
  return "log";
}

inline void writeLine(Level level, std::string_view tag, std::string_view message) {
  ++counters()[static_cast<std::size_t>(level)];
  if (level < minLevel())
    return;
  const std::string line = std::format("{}: {}: {}\n", levelName(level), tag, message);
  (void)std::fwrite(line.data(), 1, line.size(), stderr);
}

template <typename... Args>
inline void logf(Level level, std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
  writeLine(level, tag, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
inline void debugf(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
  logf(Level::Debug, tag, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void infof(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
  logf(Level::Info, tag, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warnf(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
  logf(Level::Warn, tag, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
inline void errorf(std::string_view tag, std::format_string<Args...> fmt, Args&&... args) {
  logf(Level::Error, tag, fmt, std::forward<Args>(args)...);
}

}  // namespace Log
