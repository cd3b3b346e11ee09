#pragma once
/**
 * @file common/config_detect.hpp
 * @brief Internal helpers for detecting monitor configuration.
 *
 * This header is intentionally placed under `src/` (not installed) because it
 * is an implementation detail of `loadMonitorOptions()`.
 */

#include <istream>
#include <string>

#include <luuma-cursor/config.hpp>
#include <luuma-cursor/core.hpp>

namespace luuma::cursor::detail {

/**
 * @brief Raw configuration values before validation.
 *
 * Each field holds the trimmed, unquoted text found for the corresponding
 * key; an empty string means the key was not set anywhere.
 */
struct ConfigStrings {
  std::string intervalMs;
  std::string logActivity;
  std::string logLevel;
  std::string display;

  bool empty() const {
    return intervalMs.empty() && logActivity.empty() && logLevel.empty() &&
           display.empty();
  }

  bool complete() const {
    return !intervalMs.empty() && !logActivity.empty() && !logLevel.empty() &&
           !display.empty();
  }
};

/**
 * @brief Fill missing fields of `out` from `KEY=VALUE` lines.
 *
 * `#` starts a comment, keys are case insensitive and may carry the
 * `LUUMA_CURSOR_` prefix, values may be wrapped in single or double quotes.
 * Fields already set in `out` are left alone.
 */
LUUMA_CURSOR_API void readConfigStream(std::istream &in, ConfigStrings &out);

/// Path of the config file to read, or an empty string when neither
/// `$LUUMA_CURSOR_CONFIG`, `$XDG_CONFIG_HOME` nor `$HOME` is set.
LUUMA_CURSOR_API std::string configFilePath();

/**
 * @brief Detect raw configuration values.
 *
 * Detection strategy (best-effort):
 * 1) `LUUMA_CURSOR_*` environment variables (and `DISPLAY`).
 * 2) The config file returned by `configFilePath()`, for missing fields.
 */
LUUMA_CURSOR_API ConfigStrings detectConfigStrings();

/// Parse 1/0, true/false, yes/no, on/off (case insensitive).
LUUMA_CURSOR_API bool parseBool(const std::string &text, bool &out);

/**
 * @brief Validate `in` and apply the valid fields to `options`.
 *
 * Invalid fields are logged as warnings and skipped. An out-of-range interval
 * is clamped to [kMinInterval, kMaxInterval]. A valid log level is applied
 * to the global logger right away.
 *
 * @return true if every non-empty field was valid.
 */
LUUMA_CURSOR_API bool applyConfigStrings(const ConfigStrings &in,
                                         MonitorOptions &options);

} // namespace luuma::cursor::detail
