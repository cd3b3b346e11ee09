/**
 * @file json.cpp
 * @brief JSON conversion of cursor snapshots and events via nlohmann::json.
 */

#include <luuma-cursor/json.hpp>

#include <stdexcept>

#include <nlohmann/json.hpp>

#include <luuma-cursor/log.hpp>

namespace luuma::cursor {

namespace {

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

const nlohmann::json &requireField(const nlohmann::json &j, const char *key) {
  if (!j.is_object())
    throw std::invalid_argument(std::string("expected an object holding '") +
                                key + "'");
  auto it = j.find(key);
  if (it == j.end())
    throw std::invalid_argument(std::string("missing field '") + key + "'");
  return *it;
}

// nlohmann converts booleans to arithmetic types silently, so numbers are
// checked explicitly.
double requireNumber(const nlohmann::json &j, const char *what) {
  if (!j.is_number())
    throw std::invalid_argument(std::string("'") + what +
                                "' must be a number");
  return j.get<double>();
}

std::string requireString(const nlohmann::json &j, const char *key) {
  const auto &v = requireField(j, key);
  if (!v.is_string())
    throw std::invalid_argument(std::string("'") + key + "' must be a string");
  return v.get<std::string>();
}

bool requireBool(const nlohmann::json &j, const char *key) {
  const auto &v = requireField(j, key);
  if (!v.is_boolean())
    throw std::invalid_argument(std::string("'") + key +
                                "' must be a boolean");
  return v.get<bool>();
}

Position requirePosition(const nlohmann::json &j) {
  Position p;
  from_json(requireField(j, "position"), p);
  return p;
}

Button requireButton(const nlohmann::json &j) {
  std::string text = requireString(j, "button");
  Button button = Button::Left;
  if (!buttonFromString(text, button))
    throw std::invalid_argument("unknown button '" + text + "'");
  return button;
}

template <class T>
bool parseInto(std::string_view text, T &out, std::string *error,
               const char *what) {
  try {
    nlohmann::json j = nlohmann::json::parse(text.begin(), text.end());
    T value;
    from_json(j, value);
    out = std::move(value);
    return true;
  } catch (const nlohmann::json::exception &e) {
    if (error)
      *error = std::string("invalid ") + what + " JSON: " + e.what();
  } catch (const std::invalid_argument &e) {
    if (error)
      *error = std::string("invalid ") + what + " JSON: " + e.what();
  }
  LUUMA_CURSOR_LOG_DEBUG("json: rejected %s input (%zu bytes)", what,
                         text.size());
  return false;
}

} // namespace

void to_json(nlohmann::json &j, const Position &p) {
  j = nlohmann::json::array({p.x, p.y});
}

void from_json(const nlohmann::json &j, Position &p) {
  if (!j.is_array() || j.size() != 2)
    throw std::invalid_argument("'position' must be an array of two numbers");
  p.x = requireNumber(j[0], "position[0]");
  p.y = requireNumber(j[1], "position[1]");
}

void to_json(nlohmann::json &j, const CursorState &s) {
  j = nlohmann::json{
      {"position", s.position},     {"cursor_type", s.cursorType},
      {"left_click", s.leftClick},  {"right_click", s.rightClick},
      {"timestamp", s.timestamp},
  };
}

void from_json(const nlohmann::json &j, CursorState &s) {
  if (!j.is_object())
    throw std::invalid_argument("cursor state must be an object");
  s.position = requirePosition(j);
  s.cursorType = requireString(j, "cursor_type");
  s.leftClick = requireBool(j, "left_click");
  s.rightClick = requireBool(j, "right_click");
  s.timestamp = requireString(j, "timestamp");
}

void to_json(nlohmann::json &j, const CursorEvent &e) {
  nlohmann::json payload = std::visit(
      Overloaded{
          [](const MoveEvent &m) {
            return nlohmann::json{{"position", m.position},
                                  {"cursor_type", m.cursorType},
                                  {"timestamp", m.timestamp}};
          },
          [](const ClickEvent &c) {
            return nlohmann::json{{"button", buttonToString(c.button)},
                                  {"position", c.position},
                                  {"timestamp", c.timestamp}};
          },
          [](const ReleaseEvent &r) {
            return nlohmann::json{{"button", buttonToString(r.button)},
                                  {"timestamp", r.timestamp}};
          },
          [](const TypeChangeEvent &t) {
            return nlohmann::json{{"new_type", t.newType},
                                  {"position", t.position},
                                  {"timestamp", t.timestamp}};
          },
      },
      e);

  j = nlohmann::json::object();
  j[eventTag(e)] = std::move(payload);
}

void from_json(const nlohmann::json &j, CursorEvent &e) {
  if (!j.is_object() || j.size() != 1)
    throw std::invalid_argument(
        "cursor event must be an object with exactly one variant key");

  auto it = j.begin();
  const std::string &tag = it.key();
  const nlohmann::json &body = it.value();
  if (!body.is_object())
    throw std::invalid_argument("payload of '" + tag + "' must be an object");

  if (tag == "Move") {
    e = MoveEvent{requirePosition(body), requireString(body, "cursor_type"),
                  requireString(body, "timestamp")};
  } else if (tag == "Click") {
    e = ClickEvent{requireButton(body), requirePosition(body),
                   requireString(body, "timestamp")};
  } else if (tag == "Release") {
    e = ReleaseEvent{requireButton(body), requireString(body, "timestamp")};
  } else if (tag == "TypeChange") {
    e = TypeChangeEvent{requireString(body, "new_type"), requirePosition(body),
                        requireString(body, "timestamp")};
  } else {
    throw std::invalid_argument("unknown cursor event tag '" + tag + "'");
  }
}

namespace {

// Invalid UTF-8 in a label or timestamp is written as U+FFFD instead of
// making dump() throw.
std::string dumpText(const nlohmann::json &j, int indent) {
  return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

std::string toJson(const CursorState &state) {
  nlohmann::json j;
  to_json(j, state);
  return dumpText(j, -1);
}

std::string toJson(const CursorEvent &event) {
  nlohmann::json j;
  to_json(j, event);
  return dumpText(j, -1);
}

std::string toJsonPretty(const CursorState &state) {
  nlohmann::json j;
  to_json(j, state);
  return dumpText(j, 2);
}

std::string toJsonPretty(const CursorEvent &event) {
  nlohmann::json j;
  to_json(j, event);
  return dumpText(j, 2);
}

bool fromJson(std::string_view text, CursorState &out, std::string *error) {
  return parseInto(text, out, error, "cursor state");
}

bool fromJson(std::string_view text, CursorEvent &out, std::string *error) {
  return parseInto(text, out, error, "cursor event");
}

} // namespace luuma::cursor
