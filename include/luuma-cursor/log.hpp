#pragma once
/**
 * @file log.hpp
 * @brief Lightweight printf-style logging used across luuma-cursor.
 *
 * Every line is written as `[<timestamp>] <message>` where the timestamp uses
 * the same `YYYY-MM-DD HH:MM:SS.mmm` local-time format as CursorState. Debug
 * and Info lines go to stdout, Warn and Error lines to stderr, unless a custom
 * sink has been installed with `log::setSink`.
 *
 * Usage:
 * @code{.cpp}
 * LUUMA_CURSOR_LOG_INFO("Monitor: started (interval=%lldms)", ms);
 * @endcode
 */

#include <cstdint>
#include <functional>
#include <string>

#include <luuma-cursor/core.hpp>

#if defined(__GNUC__)
#define LUUMA_CURSOR_PRINTF_FORMAT(fmtIndex, argIndex)                         \
  __attribute__((format(printf, fmtIndex, argIndex)))
#else
#define LUUMA_CURSOR_PRINTF_FORMAT(fmtIndex, argIndex)
#endif

namespace luuma {
namespace cursor {
namespace log {

enum class Level : uint8_t {
  Debug = 0,
  Info,
  Warn,
  Error,
  Off,
};

/// Receives the fully formatted line (timestamp prefix included).
using Sink = std::function<void(Level level, const std::string &line)>;

LUUMA_CURSOR_API void setLevel(Level level) noexcept;
[[nodiscard]] LUUMA_CURSOR_API Level level() noexcept;
[[nodiscard]] LUUMA_CURSOR_API bool enabled(Level level) noexcept;

/// Replace the output sink. Passing an empty function restores the default
/// stdout/stderr sink.
LUUMA_CURSOR_API void setSink(Sink sink);

/// Parse "debug", "info", "warn"/"warning", "error" or "off" (case
/// insensitive). Returns false and leaves `out` untouched otherwise.
[[nodiscard]] LUUMA_CURSOR_API bool levelFromString(const std::string &text,
                                                    Level &out);
[[nodiscard]] LUUMA_CURSOR_API const char *levelToString(Level level) noexcept;

LUUMA_CURSOR_API void write(Level level, const char *fmt, ...)
    LUUMA_CURSOR_PRINTF_FORMAT(2, 3);

} // namespace log
} // namespace cursor
} // namespace luuma

#define LUUMA_CURSOR_LOG_AT(lvl, ...)                                          \
  do {                                                                         \
    if (::luuma::cursor::log::enabled(lvl))                                    \
      ::luuma::cursor::log::write(lvl, __VA_ARGS__);                           \
  } while (0)

#define LUUMA_CURSOR_LOG_DEBUG(...)                                            \
  LUUMA_CURSOR_LOG_AT(::luuma::cursor::log::Level::Debug, __VA_ARGS__)
#define LUUMA_CURSOR_LOG_INFO(...)                                             \
  LUUMA_CURSOR_LOG_AT(::luuma::cursor::log::Level::Info, __VA_ARGS__)
#define LUUMA_CURSOR_LOG_WARN(...)                                             \
  LUUMA_CURSOR_LOG_AT(::luuma::cursor::log::Level::Warn, __VA_ARGS__)
#define LUUMA_CURSOR_LOG_ERROR(...)                                            \
  LUUMA_CURSOR_LOG_AT(::luuma::cursor::log::Level::Error, __VA_ARGS__)
