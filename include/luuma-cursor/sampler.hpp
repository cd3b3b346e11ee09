#pragma once
/**
 * @file sampler.hpp
 * @brief Platform collaborators consumed by the Monitor.
 *
 * `RawSampler` returns the raw pointer state (position, shape handle, button
 * flags) and `ShapeResolver` turns a shape handle into a cursor type label.
 * The Monitor calls both from its sampling thread only.
 *
 * `openPlatformBackend()` opens the built-in X11 implementation (works with
 * X11 sessions and XWayland, not with native Wayland clients). Tests and
 * embedders can supply their own implementations instead.
 */

#include <memory>
#include <string>

#include <luuma-cursor/core.hpp>
#include <luuma-cursor/shape.hpp>
#include <luuma-cursor/state.hpp>

namespace luuma {
namespace cursor {

/// Raw pointer state as returned by the platform for one tick.
struct RawSample {
  Position position{};
  ShapeHandle shape{0};
  bool leftDown{false};
  bool rightDown{false};
};

class LUUMA_CURSOR_API RawSampler {
public:
  virtual ~RawSampler() = default;

  /// Whether the platform capability is available at all. A sampler that is
  /// not ready cannot be used to start monitoring.
  [[nodiscard]] virtual bool isReady() const = 0;

  /// Query the current pointer state. Returns false on a transient platform
  /// error; `out` is unspecified in that case.
  virtual bool sample(RawSample &out) = 0;
};

class LUUMA_CURSOR_API ShapeResolver {
public:
  virtual ~ShapeResolver() = default;

  /// Return the cursor type label for `handle`, or an empty string when the
  /// shape is unknown to the platform.
  virtual std::string resolve(ShapeHandle handle) = 0;
};

/// Sampler/resolver pair backed by one platform connection. Both pointers
/// may refer to the same object.
struct PlatformBackend {
  std::shared_ptr<RawSampler> sampler;
  std::shared_ptr<ShapeResolver> resolver;
};

/**
 * @brief Open the platform backend.
 * @param displayName X display to connect to; empty uses `$DISPLAY`.
 * @return PlatformBackend The backend. `sampler` is null on platforms
 * without a backend, and not ready when the display cannot be opened.
 */
LUUMA_CURSOR_API PlatformBackend
openPlatformBackend(const std::string &displayName = std::string());

} // namespace cursor
} // namespace luuma
