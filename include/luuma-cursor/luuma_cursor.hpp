#pragma once

// luuma-cursor - luuma_cursor.hpp
// Umbrella public header.
//
// This single-include header pulls together the stable public surface that
// consumers commonly need:
//
//   - <luuma-cursor/core.hpp>     : version / export macros
//   - <luuma-cursor/state.hpp>    : CursorState and CursorEvent
//   - <luuma-cursor/json.hpp>     : JSON conversion of states and events
//   - <luuma-cursor/monitor.hpp>  : Monitor (pointer sampling loop) API
//   - <luuma-cursor/config.hpp>   : MonitorOptions and loadMonitorOptions()
//
// Projects that need only a subset of the API are encouraged to include the
// specific headers directly, but this file is convenient for quick prototyping.

#include <luuma-cursor/config.hpp>
#include <luuma-cursor/core.hpp>
#include <luuma-cursor/json.hpp>
#include <luuma-cursor/monitor.hpp>
#include <luuma-cursor/state.hpp>
