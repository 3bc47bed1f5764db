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
 * @brief LRU cache of strings bounded by estimated memory footprint
 *
 * Holds base64 image payloads. Inserting a new key evicts least recently
 * used entries until the new value fits the byte budget, so a single insert
 * may evict zero, one or many entries. Each entry is charged
 * estimateBytes(value).
 *
 * A value larger than the whole budget is still stored: everything else is
 * evicted first and the cache stays over budget until the next insert.
 *
 * Thread-safe; the lock is internal, never held across calls and released
 * before anything is logged.
 */
class MemoryBoundedCache
{
public:
    /**
     * @param maxMemoryMb Byte budget in megabytes (must be positive)
     * @throws ConfigurationError if maxMemoryMb <= 0 or not finite
     */
    explicit MemoryBoundedCache(double maxMemoryMb,
                                std::string name = "ImageCache",
                                std::shared_ptr<MinimalLogger> log = nullptr);

    MemoryBoundedCache(const MemoryBoundedCache&) = delete;
    MemoryBoundedCache& operator=(const MemoryBoundedCache&) = delete;

    std::optional<std::string> get(const std::string& key);

    /**
     * @brief Insert or overwrite a value
     *
     * Overwriting recomputes the byte delta in place and never evicts.
     */
    void set(const std::string& key, std::string value);

    void clear();

    bool contains(const std::string& key) const;
    std::size_t size() const;
    std::size_t estimatedBytes() const;
    std::size_t maxBytes() const { return _maxBytes; }
    double maxMemoryMb() const { return _maxMemoryMb; }

    CacheStats stats() const;

private:
    double _maxMemoryMb;
    std::size_t _maxBytes;
    std::string _name;
    std::shared_ptr<MinimalLogger> _log;

    detail::LruStore _store;
    mutable std::mutex _mutex;
};

} // namespace folio
