#include "folio/core/cache/LruStore.hpp"

#include <cassert>

namespace folio::detail {

LruStore::LruStore() : _created(SteadyClock::now()) {}

std::optional<std::string> LruStore::get(const std::string& key)
{
    auto it = _entries.find(key);
    if (it == _entries.end()) {
        ++_misses;
        return std::nullopt;
    }
    _lru.splice(_lru.begin(), _lru, it->second.orderIt);
    ++_hits;
    return it->second.value;
}

bool LruStore::update(const std::string& key, std::string& value)
{
    auto it = _entries.find(key);
    if (it == _entries.end()) {
        return false;
    }
    const std::size_t bytes = estimateBytes(value);
    assert(_storedBytes >= it->second.bytes);
    _storedBytes -= it->second.bytes;
    it->second.value = std::move(value);
    it->second.bytes = bytes;
    _storedBytes += bytes;
    _lru.splice(_lru.begin(), _lru, it->second.orderIt);
    return true;
}

std::size_t LruStore::insert(const std::string& key, std::string value)
{
    assert(!contains(key));
    const std::size_t bytes = estimateBytes(value);
    _lru.push_front(key);
    Entry entry;
    entry.value = std::move(value);
    entry.bytes = bytes;
    entry.orderIt = _lru.begin();
    _entries.emplace(key, std::move(entry));
    _storedBytes += bytes;
    return bytes;
}

LruStore::Evicted LruStore::evictOldest()
{
    assert(!_lru.empty());
    Evicted evicted;
    evicted.key = _lru.back();
    auto it = _entries.find(evicted.key);
    assert(it != _entries.end());
    evicted.bytes = it->second.bytes;
    assert(_storedBytes >= evicted.bytes);

    _storedBytes -= evicted.bytes;
    _entries.erase(it);
    _lru.pop_back();
    ++_evictions;
    _lastEviction = SteadyClock::now();
    return evicted;
}

std::size_t LruStore::clear()
{
    const std::size_t removed = _entries.size();
    _entries.clear();
    _lru.clear();
    _storedBytes = 0;
    _hits = 0;
    _misses = 0;
    _evictions = 0;
    return removed;
}

CacheStats LruStore::stats() const
{
    CacheStats s;
    s.size = _entries.size();
    s.hits = _hits;
    s.misses = _misses;
    s.evictions = _evictions;
    s.estimatedBytes = _storedBytes;
    if (_lastEviction) {
        s.secondsSinceLastEviction = secondsSince(*_lastEviction);
    }
    s.ageSeconds = secondsSince(_created);
    return s;
}

} // namespace folio::detail
