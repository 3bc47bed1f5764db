#pragma once

#include "folio/core/cache/CacheConfig.hpp"
#include "folio/core/cache/CacheStats.hpp"
#include "folio/core/cache/CountBoundedCache.hpp"
#include "folio/core/cache/MemoryBoundedCache.hpp"
#include "folio/core/cache/MemoryMonitor.hpp"
#include "folio/core/util/Logging.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <memory>

namespace folio {

struct CombinedCacheStats {
    CacheStats rendered;
    CacheStats raw;
    CacheStats images;
    MemoryStats memory;
    std::size_t totalBytes = 0;
    std::size_t totalItems = 0;

    double totalMemoryMb() const { return static_cast<double>(totalBytes) / kBytesPerMb; }
};

void to_json(nlohmann::json& j, const CombinedCacheStats& s);

/**
 * @brief Owns the chapter caches, the image cache and the memory monitor
 *
 * One instance per reading session. The layers are created once and only
 * emptied by clearAll(); the monitor keeps its history across clears.
 * Crossing the memory threshold is reported, never acted on.
 */
class CacheManager
{
public:
    /**
     * @throws ConfigurationError naming the first invalid parameter; no
     *         layer is created in that case
     */
    explicit CacheManager(const CacheConfig& config = {},
                          std::shared_ptr<MinimalLogger> log = nullptr,
                          MemoryMonitor::Sampler sampler = {});

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    CountBoundedCache& renderedChapters() { return *_rendered; }
    CountBoundedCache& rawChapters() { return *_raw; }
    MemoryBoundedCache& images() { return *_images; }
    MemoryMonitor& memoryMonitor() { return *_monitor; }

    const CacheConfig& config() const { return _config; }

    // Empties all three caches and resets their counters
    void clearAll();

    CombinedCacheStats combinedStats() const;

    bool checkMemoryThreshold();

    // Debug-level summary of every layer
    void logStats() const;

private:
    CacheConfig _config;
    std::shared_ptr<MinimalLogger> _log;
    std::unique_ptr<CountBoundedCache> _rendered;
    std::unique_ptr<CountBoundedCache> _raw;
    std::unique_ptr<MemoryBoundedCache> _images;
    std::unique_ptr<MemoryMonitor> _monitor;
};

} // namespace folio
