#pragma once

#include <algorithm>
#include <format>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <toml++/toml.h>

#include "core/Errors.h"
#include "core/Log.h"

namespace TomlUtil {

inline int& warningCounter() {
  static int counter = 0;
  return counter;
}

inline void resetWarningCount() {
  warningCounter() = 0;
}

inline int warningCount() {
  return warningCounter();
}

template <typename... Args>
inline void warnf(const char* path, std::format_string<Args...> fmt, Args&&... args) {
  ++warningCounter();
  const std::string_view prefix =
      (path != nullptr) ? std::string_view{path} : std::string_view{"<toml>"};
  Log::warnf(prefix, "{}", std::format(fmt, std::forward<Args>(args)...));
}

inline bool allowedKey(std::string_view key, std::initializer_list<std::string_view> allowed) {
  return std::ranges::any_of(allowed, [key](std::string_view a) { return key == a; });
}

inline void warnUnknownKeys(const toml::table& tbl,
                            const char* path,
                            std::string_view scope,
                            std::initializer_list<std::string_view> allowed) {
  for (const auto& [key, node] : tbl) {
    (void)node;
    std::string_view k = key.str();
    if (allowedKey(k, allowed)) {
      continue;
    }
    warnf(path, "unknown key '{}' in {}", k, scope);
  }
}

// Parses either a file (fromFile) or an in-memory document. Returns nullopt and
// warns on a syntax error.
inline std::optional<toml::table> parse(std::string_view source, const char* name, bool fromFile) {
  try {
    if (fromFile) {
      return toml::parse_file(source);
    }
    return toml::parse(source, std::string_view{name != nullptr ? name : "<toml>"});
  } catch (const toml::parse_error& err) {
    warnf(name, "parse error: {}", std::string(err.description()));
  }
  return std::nullopt;
}

// Required numeric field; missing or mistyped -> ConfigurationError.
template <typename T>
inline T require(const toml::table& t, std::string_view key, std::string_view scope) {
  if (auto v = t[key].value<T>())
    return *v;
  throw ConfigurationError(std::format("{} is missing required field '{}'", scope, key));
}

}  // namespace TomlUtil
