#pragma once
/**
 * @file shape_cache.hpp
 * @brief Memoizes shape handle -> cursor type resolution.
 *
 * Resolving a shape handle costs a round trip to the platform, while the set
 * of shapes seen during a session is small and stable. The cache stores
 * every resolved label for the lifetime of the cache and never evicts.
 */

#include <cstddef>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include <luuma-cursor/core.hpp>
#include <luuma-cursor/shape.hpp>

namespace luuma {
namespace cursor {

class LUUMA_CURSOR_API ShapeCache {
public:
  /// Returns the label for a handle, or an empty string when the handle
  /// cannot be resolved.
  using Resolver = std::function<std::string(ShapeHandle handle)>;

  explicit ShapeCache(Resolver resolver);

  ShapeCache(const ShapeCache &) = delete;
  ShapeCache &operator=(const ShapeCache &) = delete;

  /**
   * @brief Return the cursor type label for `handle`.
   *
   * The first call for a handle invokes the resolver once and stores the
   * result; later calls return the stored label. An empty result (or a
   * missing resolver) is replaced by `customCursorType(handle)`, which is
   * cached as well.
   *
   * The resolver runs without holding the lock: two threads missing on the
   * same handle may both resolve it and the last insertion wins.
   */
  std::string resolve(ShapeHandle handle);

  [[nodiscard]] bool contains(ShapeHandle handle) const;
  [[nodiscard]] std::size_t size() const;

private:
  Resolver m_resolver;
  mutable std::shared_mutex m_mutex;
  std::unordered_map<ShapeHandle, std::string> m_entries;
};

} // namespace cursor
} // namespace luuma
