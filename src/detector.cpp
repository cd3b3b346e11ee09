/**
 * @file detector.cpp
 * @brief Change detection between two cursor snapshots.
 */

#include <luuma-cursor/detector.hpp>

namespace luuma::cursor {

namespace {

void diffButton(Button button, bool wasDown, bool isDown,
                const CursorState &current, std::vector<CursorEvent> &out) {
  if (!wasDown && isDown)
    out.emplace_back(ClickEvent{button, current.position, current.timestamp});
  else if (wasDown && !isDown)
    out.emplace_back(ReleaseEvent{button, current.timestamp});
}

} // namespace

std::vector<CursorEvent> diff(const CursorState &previous,
                              const CursorState &current) {
  std::vector<CursorEvent> events;

  if (current.position != previous.position) {
    events.emplace_back(
        MoveEvent{current.position, current.cursorType, current.timestamp});
  }

  if (current.cursorType != previous.cursorType) {
    events.emplace_back(TypeChangeEvent{current.cursorType, current.position,
                                        current.timestamp});
  }

  diffButton(Button::Left, previous.leftClick, current.leftClick, current,
             events);
  diffButton(Button::Right, previous.rightClick, current.rightClick, current,
             events);

  return events;
}

} // namespace luuma::cursor
