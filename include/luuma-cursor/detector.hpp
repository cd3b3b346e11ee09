#pragma once
/**
 * @file detector.hpp
 * @brief Turns two consecutive cursor snapshots into discrete events.
 */

#include <vector>

#include <luuma-cursor/core.hpp>
#include <luuma-cursor/state.hpp>

namespace luuma {
namespace cursor {

/**
 * @brief Compare two snapshots and synthesize the events between them.
 *
 * Rules, in this order:
 *  1. position changed -> MoveEvent
 *  2. cursor type changed -> TypeChangeEvent
 *  3. left button, then right button: up->down gives ClickEvent, down->up
 *     gives ReleaseEvent
 *
 * Events carry `current`'s timestamp and position. Identical inputs produce
 * an empty sequence. Only the two endpoints are compared: motion between two
 * samples is not reconstructed.
 */
[[nodiscard]] LUUMA_CURSOR_API std::vector<CursorEvent>
diff(const CursorState &previous, const CursorState &current);

} // namespace cursor
} // namespace luuma
