#pragma once

#include "folio/core/cache/CacheStats.hpp"
#include "folio/core/cache/LruStore.hpp"
#include "folio/core/util/Logging.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace folio {

/**
 * @brief LRU cache of strings bounded by entry count
 *
 * Holds rendered or raw chapter HTML keyed by "<book path>:<index>".
 * Every hit or write moves the entry to the most-recently-used end; when a
 * new key pushes the size past the capacity, exactly one entry (the least
 * recently used) is evicted.
 *
 * All methods lock an internal mutex, so one instance may be shared between
 * the UI thread and background loaders.
 */
class CountBoundedCache
{
public:
    /**
     * @param maxSize Maximum number of entries (must be at least 1)
     * @param name Label used in log messages
     * @throws ConfigurationError if maxSize < 1
     */
    explicit CountBoundedCache(long long maxSize,
                               std::string name = "ChapterCache",
                               std::shared_ptr<MinimalLogger> log = nullptr);

    CountBoundedCache(const CountBoundedCache&) = delete;
    CountBoundedCache& operator=(const CountBoundedCache&) = delete;

    /**
     * @brief Look up a value and mark it most recently used
     * @return The stored value, or std::nullopt (only the miss counter changes)
     */
    std::optional<std::string> get(const std::string& key);

    /**
     * @brief Insert or overwrite a value
     *
     * Overwriting an existing key is not an eviction.
     */
    void set(const std::string& key, std::string value);

    /**
     * @brief Drop every entry and zero the hit/miss/eviction counters
     */
    void clear();

    bool contains(const std::string& key) const;

    std::size_t size() const;
    std::size_t maxSize() const { return _maxSize; }

    CacheStats stats() const;

private:
    std::size_t _maxSize;
    std::string _name;
    std::shared_ptr<MinimalLogger> _log;

    detail::LruStore _store;
    mutable std::mutex _mutex;
};

} // namespace folio
