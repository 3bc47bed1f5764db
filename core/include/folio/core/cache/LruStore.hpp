#pragma once

#include "folio/core/cache/CacheStats.hpp"

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace folio::detail {

/**
 * @brief Recency-ordered string store with the counters both caches report
 *
 * Holds the LRU order, the per-entry byte charge and the hit, miss and
 * eviction counters. It has no capacity of its own: the owning cache decides
 * when to call evictOldest(). Not synchronised; the owner locks around every
 * call and logs only after unlocking.
 */
class LruStore
{
public:
    LruStore();

    // Marks a hit most recently used; counts the hit or miss
    std::optional<std::string> get(const std::string& key);

    // Replaces the value of an existing key in place and marks it most
    // recently used. Returns false, leaving `value` untouched, if the key
    // is absent.
    bool update(const std::string& key, std::string& value);

    // Adds a new key as most recently used; returns its byte charge
    std::size_t insert(const std::string& key, std::string value);

    struct Evicted {
        std::string key;
        std::size_t bytes = 0;
    };

    // Removes the least recently used entry. Store must not be empty.
    Evicted evictOldest();

    // Drops every entry and zeroes the counters; returns the entry count
    std::size_t clear();

    bool contains(const std::string& key) const { return _entries.find(key) != _entries.end(); }
    bool empty() const { return _entries.empty(); }
    std::size_t size() const { return _entries.size(); }
    std::size_t storedBytes() const { return _storedBytes; }
    uint64_t hits() const { return _hits; }
    uint64_t misses() const { return _misses; }

    // Capacity fields are left for the owner to fill
    CacheStats stats() const;

private:
    struct Entry {
        std::string value;
        std::size_t bytes = 0;
        std::list<std::string>::iterator orderIt;
    };

    // Front is most recently used
    std::list<std::string> _lru;
    std::unordered_map<std::string, Entry> _entries;
    std::size_t _storedBytes = 0;

    uint64_t _hits = 0;
    uint64_t _misses = 0;
    uint64_t _evictions = 0;
    std::optional<SteadyClock::time_point> _lastEviction;
    const SteadyClock::time_point _created;
};

} // namespace folio::detail
