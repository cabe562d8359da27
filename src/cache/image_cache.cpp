#include <remoteimage/cache/image_cache.hpp>

#include <remoteimage/decode/image_decoder.hpp>

#include <spdlog/spdlog.h>

namespace remoteimage
{

ImageCache::ImageCache(const CacheConfig &config) : _config(config)
{
}

std::optional<CacheEntry> ImageCache::get(const std::string &key)
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _slots.find(key);
    if (it == _slots.end())
    {
        _cache_misses++;
        return std::nullopt;
    }

    _lru_order.splice(_lru_order.begin(), _lru_order, it->second.order);
    it->second.entry.last_access = std::chrono::steady_clock::now();
    _cache_hits++;
    return it->second.entry;
}

bool ImageCache::set(const std::string &key, ImagePtr payload, size_t size)
{
    std::lock_guard<std::mutex> lock(_mutex);

    if (_config.max_bytes > 0 && size > _config.max_bytes)
    {
        spdlog::warn("Not caching {}: {} bytes exceeds cache capacity of {} bytes", key, size, _config.max_bytes);
        return false;
    }

    auto now = std::chrono::steady_clock::now();
    auto it = _slots.find(key);
    if (it != _slots.end())
    {
        _total_bytes -= it->second.entry.size;
        it->second.entry.payload = std::move(payload);
        it->second.entry.size = size;
        it->second.entry.last_access = now;
        _lru_order.splice(_lru_order.begin(), _lru_order, it->second.order);
    }
    else
    {
        _lru_order.push_front(key);
        Slot slot{CacheEntry{key, std::move(payload), size, now}, _lru_order.begin()};
        _slots.emplace(key, std::move(slot));
    }
    _total_bytes += size;

    evictUntilWithinCapacity(key);

    spdlog::debug("Cached {} ({} bytes, cache size: {} entries / {} bytes)", key, size, _slots.size(), _total_bytes);
    return true;
}

bool ImageCache::set(const std::string &key, ImagePtr payload)
{
    size_t size = payload ? image_byte_size(*payload) : 0;
    return set(key, std::move(payload), size);
}

bool ImageCache::invalidate(const std::string &key)
{
    std::lock_guard<std::mutex> lock(_mutex);

    auto it = _slots.find(key);
    if (it == _slots.end())
    {
        return false;
    }

    _total_bytes -= it->second.entry.size;
    _lru_order.erase(it->second.order);
    _slots.erase(it);
    return true;
}

void ImageCache::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _slots.clear();
    _lru_order.clear();
    _total_bytes = 0;
    spdlog::debug("Cleared image cache. Stats: {} hits, {} misses, {} evictions", _cache_hits, _cache_misses,
                  _evictions);
}

bool ImageCache::contains(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _slots.find(key) != _slots.end();
}

size_t ImageCache::size_bytes() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _total_bytes;
}

size_t ImageCache::size_entries() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _slots.size();
}

size_t ImageCache::getCacheHits() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _cache_hits;
}

size_t ImageCache::getCacheMisses() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _cache_misses;
}

size_t ImageCache::getEvictions() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _evictions;
}

bool ImageCache::overCapacity() const
{
    return (_config.max_bytes > 0 && _total_bytes > _config.max_bytes) ||
           (_config.max_entries > 0 && _slots.size() > _config.max_entries);
}

void ImageCache::evictUntilWithinCapacity(const std::string &protected_key)
{
    while (overCapacity() && !_lru_order.empty())
    {
        const std::string &oldest = _lru_order.back();
        if (oldest == protected_key)
        {
            // only the new entry is left
            break;
        }

        auto it = _slots.find(oldest);
        _total_bytes -= it->second.entry.size;
        spdlog::debug("Evicted {} from cache", oldest);
        _slots.erase(it);
        _lru_order.pop_back();
        _evictions++;
    }
}

} // namespace remoteimage
