#include "folio/core/cache/CacheManager.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace folio {

void to_json(nlohmann::json& j, const CombinedCacheStats& s)
{
    j = nlohmann::json{
        {"rendered_stats", s.rendered},
        {"raw_stats", s.raw},
        {"image_stats", s.images},
        {"memory_stats", s.memory},
        {"total_memory_mb", s.totalMemoryMb()},
        {"total_items", s.totalItems},
    };
}

CacheManager::CacheManager(const CacheConfig& config,
                           std::shared_ptr<MinimalLogger> log,
                           MemoryMonitor::Sampler sampler)
    : _config(config)
    , _log(LoggerOr(std::move(log)))
{
    _config.validate();

    _rendered = std::make_unique<CountBoundedCache>(_config.renderedMaxChapters, "RenderedChapterCache", _log);
    _raw = std::make_unique<CountBoundedCache>(_config.rawMaxChapters, "RawChapterCache", _log);
    _images = std::make_unique<MemoryBoundedCache>(_config.imageMaxMemoryMb, "ImageCache", _log);
    _monitor = std::make_unique<MemoryMonitor>(_config.memoryThresholdMb, _log, std::move(sampler));

    _log->info("CacheManager initialized: rendered={}, raw={}, images={}MB, threshold={}MB",
               _config.renderedMaxChapters, _config.rawMaxChapters,
               _config.imageMaxMemoryMb, _config.memoryThresholdMb);
}

void CacheManager::clearAll()
{
    _log->info("Clearing all cache layers");
    _rendered->clear();
    _raw->clear();
    _images->clear();
}

CombinedCacheStats CacheManager::combinedStats() const
{
    CombinedCacheStats s;
    s.rendered = _rendered->stats();
    s.raw = _raw->stats();
    s.images = _images->stats();
    s.memory = _monitor->stats();
    s.totalBytes = s.rendered.estimatedBytes + s.raw.estimatedBytes + s.images.estimatedBytes;
    s.totalItems = s.rendered.size + s.raw.size + s.images.size;
    return s;
}

bool CacheManager::checkMemoryThreshold()
{
    return _monitor->checkThreshold();
}

void CacheManager::logStats() const
{
    if (LogLevel::Debug < _log->level()) return;

    const auto s = combinedStats();
    _log->debug("Cache stats: rendered={}/{}, raw={}/{}, images={} ({:.1f}/{:.1f} MB)",
                s.rendered.size, s.rendered.maxSize,
                s.raw.size, s.raw.maxSize,
                s.images.size, s.images.memoryMb(), s.images.maxMemoryMb());
    _log->debug("Cache performance: rendered hit_rate={:.1f}%, raw hit_rate={:.1f}%, images hit_rate={:.1f}%",
                s.rendered.hitRate(), s.raw.hitRate(), s.images.hitRate());
    _log->debug("Memory: total_cache={:.1f} MB, process={:.1f} MB, threshold={} MB",
                s.totalMemoryMb(), s.memory.currentUsageMb, s.memory.thresholdMb);
}

} // namespace folio
