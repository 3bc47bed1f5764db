#include "folio/core/cache/CountBoundedCache.hpp"

#include "folio/core/util/Errors.hpp"

#include <utility>

namespace folio {

CountBoundedCache::CountBoundedCache(long long maxSize,
                                     std::string name,
                                     std::shared_ptr<MinimalLogger> log)
    : _maxSize(0)
    , _name(std::move(name))
    , _log(LoggerOr(std::move(log)))
{
    if (maxSize < 1) {
        throw ConfigurationError(_name + ": maxsize must be at least 1 (got " + std::to_string(maxSize) + ")");
    }
    _maxSize = static_cast<std::size_t>(maxSize);
    _log->info("{} initialized with maxsize={}", _name, _maxSize);
}

std::optional<std::string> CountBoundedCache::get(const std::string& key)
{
    std::optional<std::string> value;
    uint64_t hits = 0, misses = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        value = _store.get(key);
        hits = _store.hits();
        misses = _store.misses();
    }
    _log->debug("{} {}: {} (hits={}, misses={})", _name, value ? "HIT" : "MISS", key, hits, misses);
    return value;
}

void CountBoundedCache::set(const std::string& key, std::string value)
{
    bool updated = false;
    std::optional<std::string> evicted;
    std::size_t size = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        updated = _store.update(key, value);
        if (!updated) {
            _store.insert(key, std::move(value));
            if (_store.size() > _maxSize) {
                evicted = _store.evictOldest().key;
            }
        }
        size = _store.size();
    }

    if (updated) {
        _log->debug("{} UPDATE: {}", _name, key);
    } else if (evicted) {
        _log->info("{} EVICTION: {} (cache full: {}/{})", _name, *evicted, size, _maxSize);
    } else {
        _log->debug("{} SET: {} (size: {}/{})", _name, key, size, _maxSize);
    }
}

void CountBoundedCache::clear()
{
    std::size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        removed = _store.clear();
    }
    _log->info("{} CLEARED: removed {} entries", _name, removed);
}

bool CountBoundedCache::contains(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _store.contains(key);
}

std::size_t CountBoundedCache::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _store.size();
}

CacheStats CountBoundedCache::stats() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    CacheStats s = _store.stats();
    s.maxSize = _maxSize;
    return s;
}

} // namespace folio
