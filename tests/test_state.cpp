#include <catch2/catch_all.hpp>

#include <chrono>
#include <ctime>
#include <regex>
#include <string>

#include <luuma-cursor/state.hpp>

using namespace luuma::cursor;
using namespace std::chrono_literals;

namespace {

const std::regex kTimestampPattern(
    R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}$)");

std::string localSeconds(std::time_t tt) {
  std::tm local{};
  localtime_r(&tt, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return buf;
}

} // namespace

TEST_CASE("timestamps use local time with truncated milliseconds",
          "[state]") {
  const std::time_t base = 1700000000;
  auto tp = std::chrono::system_clock::from_time_t(base) + 123ms + 999us;

  std::string text = formatTimestamp(tp);
  CHECK(std::regex_match(text, kTimestampPattern));
  CHECK(text == localSeconds(base) + ".123");

  auto almostNext = std::chrono::system_clock::from_time_t(base) + 999ms +
                    999us;
  CHECK(formatTimestamp(almostNext) == localSeconds(base) + ".999");
}

TEST_CASE("current timestamp matches the wire format", "[state]") {
  CHECK(std::regex_match(currentTimestamp(), kTimestampPattern));
}

TEST_CASE("default cursor state", "[state]") {
  CursorState s;
  CHECK(s.position == Position{0.0, 0.0});
  CHECK(s.cursorType == "default");
  CHECK_FALSE(s.leftClick);
  CHECK_FALSE(s.rightClick);
  CHECK(std::regex_match(s.timestamp, kTimestampPattern));
}

TEST_CASE("cursor state equality covers every field", "[state]") {
  CursorState a({1.0, 2.0}, "arrow", false, true, "2024-01-01 00:00:00.000");
  CursorState b = a;
  CHECK(a == b);

  b.position.x = 1.5;
  CHECK(a != b);
  b = a;
  b.cursorType = "hand";
  CHECK(a != b);
  b = a;
  b.leftClick = true;
  CHECK(a != b);
  b = a;
  b.timestamp = "2024-01-01 00:00:00.001";
  CHECK(a != b);
}

TEST_CASE("button names", "[state]") {
  CHECK(std::string(buttonToString(Button::Left)) == "left");
  CHECK(std::string(buttonToString(Button::Right)) == "right");

  Button b = Button::Left;
  CHECK(buttonFromString("right", b));
  CHECK(b == Button::Right);
  CHECK_FALSE(buttonFromString("middle", b));
  CHECK(b == Button::Right);
}

TEST_CASE("event tags and log descriptions", "[state]") {
  const std::string ts = "2024-01-01 12:00:00.000";

  CursorEvent move = MoveEvent{{150.0, 120.0}, "hand", ts};
  CHECK(std::string(eventTag(move)) == "Move");
  CHECK(describeEvent(move) == "Cursor Pos: (150, 120) | Type: hand");

  CursorEvent type = TypeChangeEvent{"ibeam", {1.0, 2.0}, ts};
  CHECK(std::string(eventTag(type)) == "TypeChange");
  CHECK(describeEvent(type) == "Cursor type changed to: ibeam");

  CursorEvent click = ClickEvent{Button::Right, {10.0, 20.0}, ts};
  CHECK(std::string(eventTag(click)) == "Click");
  CHECK(describeEvent(click) == "Right click at position (10, 20)");

  CursorEvent release = ReleaseEvent{Button::Left, ts};
  CHECK(std::string(eventTag(release)) == "Release");
  CHECK(describeEvent(release) == "Left click released");
}
