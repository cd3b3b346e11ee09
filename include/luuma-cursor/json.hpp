#pragma once
/**
 * @file json.hpp
 * @brief JSON representation of cursor snapshots and events.
 *
 * Wire shapes:
 *
 *   CursorState:
 *     {"position":[x,y],"cursor_type":"...","left_click":bool,
 *      "right_click":bool,"timestamp":"..."}
 *
 *   CursorEvent: a single-key object, the key being the variant tag:
 *     {"Move":{"position":[x,y],"cursor_type":"...","timestamp":"..."}}
 *     {"Click":{"button":"left","position":[x,y],"timestamp":"..."}}
 *     {"Release":{"button":"right","timestamp":"..."}}
 *     {"TypeChange":{"new_type":"...","position":[x,y],"timestamp":"..."}}
 *
 * Parsing is strict about required fields and their JSON types; unknown
 * extra fields inside a payload are ignored.
 */

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include <luuma-cursor/core.hpp>
#include <luuma-cursor/state.hpp>

namespace luuma {
namespace cursor {

[[nodiscard]] LUUMA_CURSOR_API std::string toJson(const CursorState &state);
[[nodiscard]] LUUMA_CURSOR_API std::string toJson(const CursorEvent &event);

/// Same as toJson but indented with two spaces.
[[nodiscard]] LUUMA_CURSOR_API std::string
toJsonPretty(const CursorState &state);
[[nodiscard]] LUUMA_CURSOR_API std::string
toJsonPretty(const CursorEvent &event);

/**
 * @brief Parse the canonical JSON text of a CursorState.
 * @param text JSON text (compact or pretty).
 * @param out Receives the parsed value; untouched on failure.
 * @param error Optional; receives a description of the failure.
 * @return true on success; false if the text is malformed or does not match
 * the schema.
 */
[[nodiscard]] LUUMA_CURSOR_API bool
fromJson(std::string_view text, CursorState &out, std::string *error = nullptr);

/// CursorEvent overload of fromJson.
[[nodiscard]] LUUMA_CURSOR_API bool
fromJson(std::string_view text, CursorEvent &out, std::string *error = nullptr);

// nlohmann::json hooks (found through ADL). The from_json overloads throw
// nlohmann::json::exception or std::invalid_argument on schema mismatch.
LUUMA_CURSOR_API void to_json(nlohmann::json &j, const Position &p);
LUUMA_CURSOR_API void from_json(const nlohmann::json &j, Position &p);
LUUMA_CURSOR_API void to_json(nlohmann::json &j, const CursorState &s);
LUUMA_CURSOR_API void from_json(const nlohmann::json &j, CursorState &s);
LUUMA_CURSOR_API void to_json(nlohmann::json &j, const CursorEvent &e);
LUUMA_CURSOR_API void from_json(const nlohmann::json &j, CursorEvent &e);

} // namespace cursor
} // namespace luuma
