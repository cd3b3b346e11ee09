#pragma once
/**
 * @file state.hpp
 * @brief Cursor data model: snapshots (CursorState) and derived events
 * (CursorEvent).
 *
 * A `CursorState` is a value snapshot of the pointer at one sampling tick.
 * Events are derived from two consecutive snapshots by the change detector
 * (see `<luuma-cursor/detector.hpp>`) and are never stored as authoritative
 * state.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

#include <luuma-cursor/core.hpp>

namespace luuma {
namespace cursor {

/// Pointer coordinates in screen pixels. Compared exactly (no tolerance):
/// both sides of a comparison originate from the same integer pixel source.
struct Position {
  double x{0.0};
  double y{0.0};

  bool operator==(const Position &other) const {
    return x == other.x && y == other.y;
  }
  bool operator!=(const Position &other) const { return !(*this == other); }
};

enum class Button : uint8_t {
  Left = 0,
  Right,
};

/// "left" or "right".
[[nodiscard]] LUUMA_CURSOR_API const char *buttonToString(Button button);

/// Parse "left"/"right". Returns false and leaves `out` untouched otherwise.
[[nodiscard]] LUUMA_CURSOR_API bool buttonFromString(const std::string &text,
                                                     Button &out);

/**
 * @brief Snapshot of the pointer at one instant.
 *
 * Treated as immutable once published: the monitor builds a new value on
 * every tick and swaps it in as a whole.
 */
struct LUUMA_CURSOR_API CursorState {
  Position position{};
  std::string cursorType{"default"};
  bool leftClick{false};
  bool rightClick{false};
  std::string timestamp;

  /// Default snapshot stamped with the current time.
  CursorState();
  CursorState(Position pos, std::string type, bool left, bool right,
              std::string stamp);

  bool operator==(const CursorState &other) const;
  bool operator!=(const CursorState &other) const { return !(*this == other); }
};

struct MoveEvent {
  Position position;
  std::string cursorType;
  std::string timestamp;

  bool operator==(const MoveEvent &o) const {
    return position == o.position && cursorType == o.cursorType &&
           timestamp == o.timestamp;
  }
};

struct ClickEvent {
  Button button{Button::Left};
  Position position;
  std::string timestamp;

  bool operator==(const ClickEvent &o) const {
    return button == o.button && position == o.position &&
           timestamp == o.timestamp;
  }
};

struct ReleaseEvent {
  Button button{Button::Left};
  std::string timestamp;

  bool operator==(const ReleaseEvent &o) const {
    return button == o.button && timestamp == o.timestamp;
  }
};

struct TypeChangeEvent {
  std::string newType;
  Position position;
  std::string timestamp;

  bool operator==(const TypeChangeEvent &o) const {
    return newType == o.newType && position == o.position &&
           timestamp == o.timestamp;
  }
};

/// Closed set of cursor notifications produced for one tick.
using CursorEvent =
    std::variant<MoveEvent, ClickEvent, ReleaseEvent, TypeChangeEvent>;

/// Wire tag of the active alternative: "Move", "Click", "Release" or
/// "TypeChange".
[[nodiscard]] LUUMA_CURSOR_API const char *eventTag(const CursorEvent &event);

/// Human readable log line for an event, e.g. "Left click at position
/// (150, 120)".
[[nodiscard]] LUUMA_CURSOR_API std::string
describeEvent(const CursorEvent &event);

/// Format as `YYYY-MM-DD HH:MM:SS.mmm` in local time, milliseconds truncated.
[[nodiscard]] LUUMA_CURSOR_API std::string
formatTimestamp(std::chrono::system_clock::time_point tp);

/// `formatTimestamp(std::chrono::system_clock::now())`.
[[nodiscard]] LUUMA_CURSOR_API std::string currentTimestamp();

} // namespace cursor
} // namespace luuma
