#pragma once
/**
 * @file backend/x11_backend.hpp
 * @brief Internal X11/XFixes pointer backend.
 *
 * Position and button state come from `XQueryPointer` on the root window of
 * the default screen. The shape handle is the XFixes cursor serial; the
 * cursor name atom reported alongside it is resolved to a label lazily with
 * `XGetAtomName`, one server round trip that ShapeCache makes sure is paid
 * once per shape.
 */

#if defined(__linux__)

#include <string>
#include <unordered_map>

#include <X11/Xlib.h>

#include <luuma-cursor/sampler.hpp>

namespace luuma::cursor::detail {

class X11Backend final : public RawSampler, public ShapeResolver {
public:
  explicit X11Backend(const std::string &displayName);
  ~X11Backend() override;

  X11Backend(const X11Backend &) = delete;
  X11Backend &operator=(const X11Backend &) = delete;

  [[nodiscard]] bool isReady() const override;
  bool sample(RawSample &out) override;
  std::string resolve(ShapeHandle handle) override;

private:
  Display *m_display{nullptr};
  Window m_root{0};
  bool m_hasXFixes{false};
  // Cursor serial -> name atom, as last reported by XFixes.
  std::unordered_map<ShapeHandle, Atom> m_shapeNames;
};

} // namespace luuma::cursor::detail

#endif // __linux__
