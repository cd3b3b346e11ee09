/**
 * @file shape_cache.cpp
 * @brief ShapeCache implementation.
 */

#include <luuma-cursor/shape_cache.hpp>

#include <mutex>
#include <utility>

#include <luuma-cursor/log.hpp>

namespace luuma::cursor {

ShapeCache::ShapeCache(Resolver resolver) : m_resolver(std::move(resolver)) {}

std::string ShapeCache::resolve(ShapeHandle handle) {
  {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(handle);
    if (it != m_entries.end())
      return it->second;
  }

  std::string label;
  if (m_resolver)
    label = m_resolver(handle);
  if (label.empty())
    label = customCursorType(handle);

  LUUMA_CURSOR_LOG_DEBUG("ShapeCache: resolved handle=0x%llx -> %s",
                         static_cast<unsigned long long>(handle),
                         label.c_str());

  std::unique_lock<std::shared_mutex> lock(m_mutex);
  m_entries.insert_or_assign(handle, label);
  return label;
}

bool ShapeCache::contains(ShapeHandle handle) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  return m_entries.find(handle) != m_entries.end();
}

std::size_t ShapeCache::size() const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  return m_entries.size();
}

} // namespace luuma::cursor
