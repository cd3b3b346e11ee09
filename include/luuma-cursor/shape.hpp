#pragma once
/**
 * @file shape.hpp
 * @brief Cursor shape identity and symbolic cursor type labels.
 *
 * The platform exposes the active pointer shape as an opaque handle. The
 * shape resolver turns a handle into one of the labels returned by
 * `knownCursorTypes()`, or into a synthesized `custom_<id>` label when the
 * shape is not one of the built-ins.
 */

#include <cstdint>
#include <string>
#include <vector>

#include <luuma-cursor/core.hpp>

namespace luuma {
namespace cursor {

/// Opaque platform identifier of the active pointer shape. On X11 this is the
/// XFixes cursor serial.
using ShapeHandle = std::uintptr_t;

/// The fixed set of built-in labels, in a stable order.
[[nodiscard]] LUUMA_CURSOR_API const std::vector<std::string> &
knownCursorTypes();

/// Map an X cursor / CSS cursor name (e.g. "left_ptr", "xterm", "hand2",
/// "ew-resize") to a built-in label. Returns an empty string when the name is
/// not recognized.
[[nodiscard]] LUUMA_CURSOR_API std::string
cursorTypeForName(const std::string &name);

/// Fallback label derived from the handle's own identity, e.g.
/// "custom_0x2a".
[[nodiscard]] LUUMA_CURSOR_API std::string customCursorType(ShapeHandle handle);

} // namespace cursor
} // namespace luuma
