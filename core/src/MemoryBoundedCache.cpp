#include "folio/core/cache/MemoryBoundedCache.hpp"

#include "folio/core/util/Errors.hpp"

#include <cmath>
#include <utility>
#include <vector>

namespace folio {

MemoryBoundedCache::MemoryBoundedCache(double maxMemoryMb,
                                       std::string name,
                                       std::shared_ptr<MinimalLogger> log)
    : _maxMemoryMb(maxMemoryMb)
    , _maxBytes(0)
    , _name(std::move(name))
    , _log(LoggerOr(std::move(log)))
{
    if (!std::isfinite(maxMemoryMb) || maxMemoryMb <= 0.0) {
        throw ConfigurationError(_name + ": max_memory_mb must be positive (got " + std::to_string(maxMemoryMb) + ")");
    }
    _maxBytes = static_cast<std::size_t>(maxMemoryMb * kBytesPerMb);
    if (_maxBytes == 0) {
        throw ConfigurationError(_name + ": max_memory_mb is smaller than one byte");
    }
    _log->info("{} initialized with max_memory={} MB", _name, _maxMemoryMb);
}

std::optional<std::string> MemoryBoundedCache::get(const std::string& key)
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

void MemoryBoundedCache::set(const std::string& key, std::string value)
{
    struct Eviction {
        detail::LruStore::Evicted entry;
        std::size_t storedAfter = 0;
    };

    const std::size_t bytes = estimateBytes(value);
    bool updated = false;
    std::vector<Eviction> evictions;
    std::size_t stored = 0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        updated = _store.update(key, value);
        if (!updated) {
            while (!_store.empty() && _store.storedBytes() + bytes > _maxBytes) {
                Eviction e;
                e.entry = _store.evictOldest();
                e.storedAfter = _store.storedBytes();
                evictions.push_back(std::move(e));
            }
            _store.insert(key, std::move(value));
        }
        stored = _store.storedBytes();
    }

    if (updated) {
        _log->debug("{} UPDATE: {} (size: {} bytes)", _name, key, bytes);
        return;
    }
    for (const auto& e : evictions) {
        _log->info("{} EVICTION: {} (size: {} bytes, memory: {:.2f}/{:.2f} MB)",
                   _name, e.entry.key, e.entry.bytes, static_cast<double>(e.storedAfter) / kBytesPerMb, _maxMemoryMb);
    }
    if (bytes > _maxBytes) {
        _log->warn("{} item {} ({} bytes) exceeds the whole budget of {} bytes", _name, key, bytes, _maxBytes);
    }
    _log->debug("{} SET: {} (size: {} bytes, memory: {:.2f}/{:.2f} MB)",
                _name, key, bytes, static_cast<double>(stored) / kBytesPerMb, _maxMemoryMb);
}

void MemoryBoundedCache::clear()
{
    std::size_t removed = 0;
    double freedMb = 0.0;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        freedMb = static_cast<double>(_store.storedBytes()) / kBytesPerMb;
        removed = _store.clear();
    }
    _log->info("{} CLEARED: removed {} entries ({:.2f} MB freed)", _name, removed, freedMb);
}

bool MemoryBoundedCache::contains(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _store.contains(key);
}

std::size_t MemoryBoundedCache::size() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _store.size();
}

std::size_t MemoryBoundedCache::estimatedBytes() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _store.storedBytes();
}

CacheStats MemoryBoundedCache::stats() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    CacheStats s = _store.stats();
    s.maxBytes = _maxBytes;
    return s;
}

} // namespace folio
