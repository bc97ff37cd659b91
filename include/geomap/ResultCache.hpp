#ifndef GEOMAP_RESULT_CACHE_HPP
#define GEOMAP_RESULT_CACHE_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace geomap {

/**
 * @brief Key/value cache with per-entry time-to-live
 *
 * Expiry is enforced by the cache; callers never purge entries themselves.
 */
class ResultCache {
public:
  virtual ~ResultCache() = default;

  virtual std::optional<std::string> get(const std::string &key) = 0;
  virtual void set(const std::string &key, const std::string &value,
                   std::chrono::seconds ttl) = 0;
};

/**
 * @brief Thread-safe process-local cache
 *
 * An expired entry is dropped when it is read, and every set() sweeps all
 * expired entries.
 */
class InMemoryResultCache : public ResultCache {
public:
  using Clock = std::chrono::steady_clock;

  std::optional<std::string> get(const std::string &key) override;
  void set(const std::string &key, const std::string &value,
           std::chrono::seconds ttl) override;

  size_t size() const;

private:
  struct Entry {
    std::string value;
    Clock::time_point expiresAt;
  };

  std::map<std::string, Entry> m_entries;
  mutable std::mutex m_mutex;
};

} // namespace geomap

#endif // GEOMAP_RESULT_CACHE_HPP
