/**
 * @file common/config_detect.cpp
 * @brief Internal helpers for detecting monitor configuration on Linux.
 */

#include "common/config_detect.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>

#include <luuma-cursor/log.hpp>

namespace luuma::cursor::detail {

namespace {

constexpr const char *kEnvPrefix = "LUUMA_CURSOR_";

void trimInPlace(std::string &s) {
  const char *ws = " \t\r\n";
  size_t a = s.find_first_not_of(ws);
  if (a == std::string::npos) {
    s.clear();
    return;
  }
  size_t b = s.find_last_not_of(ws);
  s = s.substr(a, b - a + 1);
}

void stripSurroundingQuotes(std::string &s) {
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') ||
                        (s.front() == '\'' && s.back() == '\''))) {
    s = s.substr(1, s.size() - 2);
  }
}

// Normalize keys for comparison: upper case, without the env prefix.
std::string normalizeKey(std::string key) {
  trimInPlace(key);
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  const std::string prefix(kEnvPrefix);
  if (key.compare(0, prefix.size(), prefix) == 0)
    key.erase(0, prefix.size());
  return key;
}

void setIfEmpty(std::string &dst, const std::string &value) {
  if (dst.empty())
    dst = value;
}

void readEnv(const char *name, std::string &dst) {
  if (const char *env = std::getenv(name)) {
    dst = env;
    trimInPlace(dst);
  }
}

} // namespace

void readConfigStream(std::istream &in, ConfigStrings &out) {
  std::string line;
  while (std::getline(in, line)) {
    size_t comment = line.find('#');
    if (comment != std::string::npos)
      line.resize(comment);
    trimInPlace(line);
    if (line.empty())
      continue;

    size_t eq = line.find('=');
    if (eq == std::string::npos)
      continue;

    std::string key = normalizeKey(line.substr(0, eq));
    std::string val = line.substr(eq + 1);
    trimInPlace(val);
    stripSurroundingQuotes(val);
    trimInPlace(val);

    if (val.empty())
      continue;

    if (key == "INTERVAL_MS")
      setIfEmpty(out.intervalMs, val);
    else if (key == "LOG_ACTIVITY")
      setIfEmpty(out.logActivity, val);
    else if (key == "LOG_LEVEL")
      setIfEmpty(out.logLevel, val);
    else if (key == "DISPLAY")
      setIfEmpty(out.display, val);
    else
      LUUMA_CURSOR_LOG_DEBUG("config: ignoring unknown key '%s'", key.c_str());
  }
}

std::string configFilePath() {
  if (const char *explicitPath = std::getenv("LUUMA_CURSOR_CONFIG")) {
    if (*explicitPath)
      return explicitPath;
  }
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME")) {
    if (*xdg)
      return std::string(xdg) + "/luuma-cursor/config";
  }
  if (const char *home = std::getenv("HOME")) {
    if (*home)
      return std::string(home) + "/.config/luuma-cursor/config";
  }
  return std::string();
}

ConfigStrings detectConfigStrings() {
  ConfigStrings out;

  // 1) Environment variables
  readEnv("LUUMA_CURSOR_INTERVAL_MS", out.intervalMs);
  readEnv("LUUMA_CURSOR_LOG_ACTIVITY", out.logActivity);
  readEnv("LUUMA_CURSOR_LOG_LEVEL", out.logLevel);
  readEnv("LUUMA_CURSOR_DISPLAY", out.display);
  if (out.display.empty())
    readEnv("DISPLAY", out.display);

  // 2) Config file, only for fields still missing.
  if (!out.complete()) {
    std::string path = configFilePath();
    if (!path.empty()) {
      std::ifstream f(path);
      if (f) {
        LUUMA_CURSOR_LOG_DEBUG("config: reading %s", path.c_str());
        readConfigStream(f, out);
      }
    }
  }

  return out;
}

bool parseBool(const std::string &text, bool &out) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    out = true;
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    out = false;
    return true;
  }
  return false;
}

bool applyConfigStrings(const ConfigStrings &in, MonitorOptions &options) {
  bool ok = true;

  if (!in.intervalMs.empty()) {
    errno = 0;
    char *end = nullptr;
    long long ms = std::strtoll(in.intervalMs.c_str(), &end, 10);
    if (errno != 0 || end == in.intervalMs.c_str() || *end != '\0') {
      LUUMA_CURSOR_LOG_WARN("config: invalid INTERVAL_MS '%s', keeping %lldms",
                            in.intervalMs.c_str(),
                            static_cast<long long>(options.interval.count()));
      ok = false;
    } else {
      long long clamped = std::clamp<long long>(ms, kMinInterval.count(),
                                                kMaxInterval.count());
      if (clamped != ms)
        LUUMA_CURSOR_LOG_WARN("config: INTERVAL_MS %lld clamped to %lld", ms,
                              clamped);
      options.interval = std::chrono::milliseconds(clamped);
    }
  }

  if (!in.logActivity.empty()) {
    bool value = options.logActivity;
    if (parseBool(in.logActivity, value)) {
      options.logActivity = value;
    } else {
      LUUMA_CURSOR_LOG_WARN("config: invalid LOG_ACTIVITY '%s'",
                            in.logActivity.c_str());
      ok = false;
    }
  }

  if (!in.logLevel.empty()) {
    log::Level lvl = log::level();
    if (log::levelFromString(in.logLevel, lvl)) {
      log::setLevel(lvl);
    } else {
      LUUMA_CURSOR_LOG_WARN("config: invalid LOG_LEVEL '%s'",
                            in.logLevel.c_str());
      ok = false;
    }
  }

  if (!in.display.empty())
    options.displayName = in.display;

  return ok;
}

} // namespace luuma::cursor::detail
