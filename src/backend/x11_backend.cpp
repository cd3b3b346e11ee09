#if defined(__linux__)

#include "backend/x11_backend.hpp"

#include <memory>

#include <X11/extensions/Xfixes.h>

#include <luuma-cursor/log.hpp>

namespace luuma::cursor {

namespace detail {

namespace {

// Xlib's default handler terminates the process on any protocol error; a
// failed query only has to skip one tick here.
int logXError(Display *display, XErrorEvent *event) {
  char text[128] = {0};
  XGetErrorText(display, event->error_code, text, sizeof(text));
  LUUMA_CURSOR_LOG_ERROR("X11: protocol error %u (%s), request %u.%u",
                         static_cast<unsigned>(event->error_code), text,
                         static_cast<unsigned>(event->request_code),
                         static_cast<unsigned>(event->minor_code));
  return 0;
}

} // namespace

X11Backend::X11Backend(const std::string &displayName) {
  XInitThreads();
  XSetErrorHandler(logXError);

  m_display =
      XOpenDisplay(displayName.empty() ? nullptr : displayName.c_str());
  if (!m_display) {
    LUUMA_CURSOR_LOG_ERROR("X11: failed to open display '%s'",
                           displayName.empty() ? XDisplayName(nullptr)
                                               : displayName.c_str());
    return;
  }
  m_root = DefaultRootWindow(m_display);

  int eventBase = 0;
  int errorBase = 0;
  if (XFixesQueryExtension(m_display, &eventBase, &errorBase)) {
    int major = 0;
    int minor = 0;
    XFixesQueryVersion(m_display, &major, &minor);
    // Cursor names arrived with XFixes 2.0.
    m_hasXFixes = major >= 2;
    LUUMA_CURSOR_LOG_DEBUG("X11: XFixes %d.%d", major, minor);
  }
  if (!m_hasXFixes) {
    LUUMA_CURSOR_LOG_ERROR("X11: XFixes >= 2.0 is required for cursor shapes");
  }

  LUUMA_CURSOR_LOG_INFO("X11: connected to '%s', ready=%u",
                        DisplayString(m_display),
                        static_cast<unsigned>(isReady()));
}

X11Backend::~X11Backend() {
  if (m_display) {
    XCloseDisplay(m_display);
    LUUMA_CURSOR_LOG_DEBUG("X11: display closed");
  }
}

bool X11Backend::isReady() const { return m_display != nullptr && m_hasXFixes; }

bool X11Backend::sample(RawSample &out) {
  if (!isReady())
    return false;

  Window rootReturn = 0;
  Window childReturn = 0;
  int rootX = 0;
  int rootY = 0;
  int winX = 0;
  int winY = 0;
  unsigned int mask = 0;
  if (!XQueryPointer(m_display, m_root, &rootReturn, &childReturn, &rootX,
                     &rootY, &winX, &winY, &mask)) {
    // Pointer is on another screen.
    LUUMA_CURSOR_LOG_DEBUG("X11: XQueryPointer reported another screen");
    return false;
  }

  std::unique_ptr<XFixesCursorImage, int (*)(void *)> image(
      XFixesGetCursorImage(m_display), XFree);
  if (!image) {
    LUUMA_CURSOR_LOG_DEBUG("X11: XFixesGetCursorImage failed");
    return false;
  }

  ShapeHandle handle = static_cast<ShapeHandle>(image->cursor_serial);
  if (m_shapeNames.find(handle) == m_shapeNames.end())
    m_shapeNames.emplace(handle, image->atom);

  out.position = Position{static_cast<double>(rootX),
                          static_cast<double>(rootY)};
  out.shape = handle;
  out.leftDown = (mask & Button1Mask) != 0;
  out.rightDown = (mask & Button3Mask) != 0;
  return true;
}

std::string X11Backend::resolve(ShapeHandle handle) {
  auto it = m_shapeNames.find(handle);
  if (!m_display || it == m_shapeNames.end() || it->second == None)
    return std::string();

  char *raw = XGetAtomName(m_display, it->second);
  if (!raw)
    return std::string();
  std::string name(raw);
  XFree(raw);

  std::string label = cursorTypeForName(name);
  LUUMA_CURSOR_LOG_DEBUG("X11: cursor serial=%llu name=%s -> %s",
                         static_cast<unsigned long long>(handle), name.c_str(),
                         label.empty() ? "(custom)" : label.c_str());
  return label;
}

} // namespace detail

PlatformBackend openPlatformBackend(const std::string &displayName) {
  auto backend = std::make_shared<detail::X11Backend>(displayName);
  return PlatformBackend{backend, backend};
}

} // namespace luuma::cursor

#endif // __linux__
