/**
 * @file state.cpp
 * @brief CursorState helpers, event descriptions and timestamp formatting.
 */

#include <luuma-cursor/state.hpp>

#include <cstdio>
#include <ctime>
#include <utility>

namespace luuma::cursor {

namespace {

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

const char *capitalizedButton(Button button) {
  return button == Button::Left ? "Left" : "Right";
}

} // namespace

const char *buttonToString(Button button) {
  return button == Button::Left ? "left" : "right";
}

bool buttonFromString(const std::string &text, Button &out) {
  if (text == "left") {
    out = Button::Left;
    return true;
  }
  if (text == "right") {
    out = Button::Right;
    return true;
  }
  return false;
}

CursorState::CursorState() : timestamp(currentTimestamp()) {}

CursorState::CursorState(Position pos, std::string type, bool left, bool right,
                         std::string stamp)
    : position(pos), cursorType(std::move(type)), leftClick(left),
      rightClick(right), timestamp(std::move(stamp)) {}

bool CursorState::operator==(const CursorState &other) const {
  return position == other.position && cursorType == other.cursorType &&
         leftClick == other.leftClick && rightClick == other.rightClick &&
         timestamp == other.timestamp;
}

const char *eventTag(const CursorEvent &event) {
  return std::visit(Overloaded{
                        [](const MoveEvent &) { return "Move"; },
                        [](const ClickEvent &) { return "Click"; },
                        [](const ReleaseEvent &) { return "Release"; },
                        [](const TypeChangeEvent &) { return "TypeChange"; },
                    },
                    event);
}

std::string describeEvent(const CursorEvent &event) {
  char buf[256];
  std::visit(
      Overloaded{
          [&](const MoveEvent &e) {
            std::snprintf(buf, sizeof(buf), "Cursor Pos: (%.0f, %.0f) | Type: %s",
                          e.position.x, e.position.y, e.cursorType.c_str());
          },
          [&](const ClickEvent &e) {
            std::snprintf(buf, sizeof(buf), "%s click at position (%.0f, %.0f)",
                          capitalizedButton(e.button), e.position.x,
                          e.position.y);
          },
          [&](const ReleaseEvent &e) {
            std::snprintf(buf, sizeof(buf), "%s click released",
                          capitalizedButton(e.button));
          },
          [&](const TypeChangeEvent &e) {
            std::snprintf(buf, sizeof(buf), "Cursor type changed to: %s",
                          e.newType.c_str());
          },
      },
      event);
  return std::string(buf);
}

std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;

  // Floor to whole seconds so pre-epoch values still get a 0..999 remainder.
  auto secs = time_point_cast<seconds>(tp);
  if (secs > tp)
    secs -= seconds(1);
  auto millis = duration_cast<milliseconds>(tp - secs).count();

  std::time_t tt = system_clock::to_time_t(secs);
  std::tm local{};
  localtime_r(&tt, &local);

  char date[32];
  if (std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local) == 0)
    return std::string();

  char out[48];
  std::snprintf(out, sizeof(out), "%s.%03lld", date,
                static_cast<long long>(millis));
  return std::string(out);
}

std::string currentTimestamp() {
  return formatTimestamp(std::chrono::system_clock::now());
}

} // namespace luuma::cursor
