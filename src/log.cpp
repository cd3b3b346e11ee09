/**
 * @file log.cpp
 * @brief Implementation of the printf-style logging layer.
 */

#include <luuma-cursor/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <vector>

#include <luuma-cursor/state.hpp>

namespace luuma::cursor::log {

namespace {

std::atomic<Level> g_level{Level::Info};

std::mutex &sinkMutex() {
  static std::mutex m;
  return m;
}

Sink &sinkSlot() {
  static Sink sink;
  return sink;
}

void defaultSink(Level lvl, const std::string &line) {
  std::FILE *stream = (lvl >= Level::Warn) ? stderr : stdout;
  std::fputs(line.c_str(), stream);
  std::fputc('\n', stream);
  std::fflush(stream);
}

std::string vformat(const char *fmt, va_list args) {
  va_list copy;
  va_copy(copy, args);
  int needed = std::vsnprintf(nullptr, 0, fmt, copy);
  va_end(copy);
  if (needed < 0)
    return std::string(fmt);

  std::vector<char> buf(static_cast<size_t>(needed) + 1);
  std::vsnprintf(buf.data(), buf.size(), fmt, args);
  return std::string(buf.data(), static_cast<size_t>(needed));
}

} // namespace

void setLevel(Level lvl) noexcept { g_level.store(lvl); }

Level level() noexcept { return g_level.load(); }

bool enabled(Level lvl) noexcept {
  Level current = g_level.load();
  return current != Level::Off && lvl != Level::Off && lvl >= current;
}

void setSink(Sink sink) {
  std::lock_guard<std::mutex> lock(sinkMutex());
  sinkSlot() = std::move(sink);
}

bool levelFromString(const std::string &text, Level &out) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (lower == "debug")
    out = Level::Debug;
  else if (lower == "info")
    out = Level::Info;
  else if (lower == "warn" || lower == "warning")
    out = Level::Warn;
  else if (lower == "error")
    out = Level::Error;
  else if (lower == "off" || lower == "none")
    out = Level::Off;
  else
    return false;
  return true;
}

const char *levelToString(Level lvl) noexcept {
  switch (lvl) {
  case Level::Debug:
    return "debug";
  case Level::Info:
    return "info";
  case Level::Warn:
    return "warn";
  case Level::Error:
    return "error";
  case Level::Off:
    return "off";
  }
  return "unknown";
}

void write(Level lvl, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  std::string message = vformat(fmt, args);
  va_end(args);

  std::string line = "[" + currentTimestamp() + "] " + message;

  // A user sink runs unlocked so it may log or replace itself.
  Sink sink;
  {
    std::lock_guard<std::mutex> lock(sinkMutex());
    if (!sinkSlot()) {
      defaultSink(lvl, line);
      return;
    }
    sink = sinkSlot();
  }
  sink(lvl, line);
}

} // namespace luuma::cursor::log
