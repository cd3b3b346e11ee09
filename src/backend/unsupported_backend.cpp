#if !defined(__linux__)

#include <luuma-cursor/sampler.hpp>

#include <luuma-cursor/log.hpp>

namespace luuma::cursor {

PlatformBackend openPlatformBackend(const std::string & /*displayName*/) {
  LUUMA_CURSOR_LOG_ERROR("openPlatformBackend: only X11 on Linux is supported");
  return PlatformBackend{};
}

} // namespace luuma::cursor

#endif // !__linux__
