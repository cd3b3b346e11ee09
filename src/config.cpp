/**
 * @file config.cpp
 * @brief loadMonitorOptions() implementation.
 */

#include <luuma-cursor/config.hpp>

#include <luuma-cursor/log.hpp>

#include "common/config_detect.hpp"

namespace luuma::cursor {

MonitorOptions loadMonitorOptions() {
  MonitorOptions options;
  detail::ConfigStrings raw = detail::detectConfigStrings();
  if (!detail::applyConfigStrings(raw, options))
    LUUMA_CURSOR_LOG_WARN("config: some settings were invalid and ignored");

  LUUMA_CURSOR_LOG_DEBUG(
      "config: interval=%lldms logActivity=%u display='%s' logLevel=%s",
      static_cast<long long>(options.interval.count()),
      static_cast<unsigned>(options.logActivity), options.displayName.c_str(),
      log::levelToString(log::level()));
  return options;
}

} // namespace luuma::cursor
