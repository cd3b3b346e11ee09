#pragma once
/**
 * @file config.hpp
 * @brief Monitor configuration and its best-effort detection from the
 * environment.
 *
 * `loadMonitorOptions()` reads, in order of precedence:
 *  1) environment variables:
 *     - `LUUMA_CURSOR_INTERVAL_MS`   debounce interval in milliseconds
 *     - `LUUMA_CURSOR_LOG_ACTIVITY`  1/0, true/false, yes/no, on/off
 *     - `LUUMA_CURSOR_LOG_LEVEL`     debug, info, warn, error, off
 *     - `LUUMA_CURSOR_DISPLAY`       X display (falls back to `DISPLAY`)
 *  2) a `KEY=VALUE` file for fields still missing, with the same keys minus
 *     the `LUUMA_CURSOR_` prefix (`INTERVAL_MS`, `LOG_ACTIVITY`, ...). The
 *     file is `$LUUMA_CURSOR_CONFIG`, else
 *     `$XDG_CONFIG_HOME/luuma-cursor/config`, else
 *     `~/.config/luuma-cursor/config`.
 *
 * Invalid values are reported with a warning and the default is kept.
 */

#include <chrono>
#include <string>

#include <luuma-cursor/core.hpp>

namespace luuma {
namespace cursor {

struct MonitorOptions {
  /// Minimum wall-clock spacing between two ticks.
  std::chrono::milliseconds interval{16};
  /// Log one line per observed occurrence (move, type change, click,
  /// release) at Info level.
  bool logActivity{true};
  /// X display to open; empty uses `$DISPLAY`.
  std::string displayName;
};

/// Smallest and largest accepted debounce interval.
inline constexpr std::chrono::milliseconds kMinInterval{1};
inline constexpr std::chrono::milliseconds kMaxInterval{1000};

/**
 * @brief Detect options from the environment and the config file.
 *
 * Also applies `LOG_LEVEL` to the global log level when present.
 */
[[nodiscard]] LUUMA_CURSOR_API MonitorOptions loadMonitorOptions();

} // namespace cursor
} // namespace luuma
