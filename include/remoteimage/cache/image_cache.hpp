#pragma once

#include <remoteimage/types/load_state.hpp>

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace remoteimage
{

struct CacheConfig
{
    // 0 means no limit in that dimension
    size_t max_bytes = 64 * 1024 * 1024;
    size_t max_entries = 0;
};

struct CacheEntry
{
    std::string key;
    ImagePtr payload;
    size_t size = 0;
    std::chrono::steady_clock::time_point last_access;
};

/**
 * Bounded in-memory store of decoded images, evicting least recently accessed
 * entries once either the byte or the entry limit is exceeded.
 *
 * All operations are serialized internally and may be called from any thread.
 */
class ImageCache
{
  public:
    explicit ImageCache(const CacheConfig &config = CacheConfig());

    ImageCache(const ImageCache &) = delete;
    ImageCache &operator=(const ImageCache &) = delete;

    // Returns a copy of the entry and marks it most recently used
    std::optional<CacheEntry> get(const std::string &key);

    // Inserts or replaces, then evicts older entries until within capacity.
    // Returns false without touching the cache if the entry alone is larger than max_bytes.
    bool set(const std::string &key, ImagePtr payload, size_t size);
    bool set(const std::string &key, ImagePtr payload);

    bool invalidate(const std::string &key);
    void clear();

    // Inspection only, does not count as an access
    bool contains(const std::string &key) const;
    size_t size_bytes() const;
    size_t size_entries() const;

    const CacheConfig &config() const
    {
        return _config;
    }

    size_t getCacheHits() const;
    size_t getCacheMisses() const;
    size_t getEvictions() const;

  private:
    struct Slot
    {
        CacheEntry entry;
        std::list<std::string>::iterator order;
    };

    bool overCapacity() const;
    void evictUntilWithinCapacity(const std::string &protected_key);

    const CacheConfig _config;

    // front is most recently used
    std::list<std::string> _lru_order;
    std::unordered_map<std::string, Slot> _slots;
    size_t _total_bytes = 0;

    mutable std::mutex _mutex;
    size_t _cache_hits = 0;
    size_t _cache_misses = 0;
    size_t _evictions = 0;
};

} // namespace remoteimage
