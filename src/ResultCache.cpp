#include "geomap/ResultCache.hpp"

namespace geomap {

std::optional<std::string> InMemoryResultCache::get(const std::string &key) {
  std::lock_guard<std::mutex> lock(m_mutex);
  auto it = m_entries.find(key);
  if (it == m_entries.end()) {
    return std::nullopt;
  }

  if (Clock::now() >= it->second.expiresAt) {
    m_entries.erase(it);
    return std::nullopt;
  }
  return it->second.value;
}

void InMemoryResultCache::set(const std::string &key, const std::string &value,
                              std::chrono::seconds ttl) {
  std::lock_guard<std::mutex> lock(m_mutex);
  Clock::time_point now = Clock::now();
  for (auto it = m_entries.begin(); it != m_entries.end();) {
    if (now >= it->second.expiresAt) {
      it = m_entries.erase(it);
    } else {
      ++it;
    }
  }
  m_entries[key] = Entry{value, now + ttl};
}

size_t InMemoryResultCache::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_entries.size();
}

} // namespace geomap
