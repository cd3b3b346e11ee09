#pragma once
/**
 * @file core.hpp
 * @brief Version and symbol visibility for luuma-cursor.
 */

#ifndef LUUMA_CURSOR_VERSION
// Overridden by the build (CMakeLists.txt passes the project version).
#define LUUMA_CURSOR_VERSION "0.1.0"
#define LUUMA_CURSOR_VERSION_MAJOR 0
#define LUUMA_CURSOR_VERSION_MINOR 1
#define LUUMA_CURSOR_VERSION_PATCH 0
#endif

// luuma_cursor_EXPORTS is set by CMake for the shared library target;
// static consumers get LUUMA_CURSOR_STATIC through the target's usage
// requirements.
#ifndef LUUMA_CURSOR_API
#if defined(_WIN32) || defined(__CYGWIN__)
#if defined(luuma_cursor_EXPORTS)
#define LUUMA_CURSOR_API __declspec(dllexport)
#elif defined(LUUMA_CURSOR_STATIC)
#define LUUMA_CURSOR_API
#else
#define LUUMA_CURSOR_API __declspec(dllimport)
#endif
#else
#if defined(__GNUC__) && (__GNUC__ >= 4)
#define LUUMA_CURSOR_API __attribute__((visibility("default")))
#else
#define LUUMA_CURSOR_API
#endif
#endif
#endif

namespace luuma {
namespace cursor {

/// Version the library was built as, e.g. "0.1.0".
inline const char *libraryVersion() noexcept { return LUUMA_CURSOR_VERSION; }

} // namespace cursor
} // namespace luuma
