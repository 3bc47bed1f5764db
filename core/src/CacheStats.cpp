#include "folio/core/cache/CacheStats.hpp"

#include <nlohmann/json.hpp>

namespace folio {

void to_json(nlohmann::json& j, const CacheStats& s)
{
    j = nlohmann::json{
        {"size", s.size},
        {"hits", s.hits},
        {"misses", s.misses},
        {"evictions", s.evictions},
        {"hit_rate", s.hitRate()},
        {"estimated_memory_mb", s.memoryMb()},
        {"avg_item_size_kb", s.averageItemBytes() / 1024.0},
        {"cache_age_seconds", s.ageSeconds},
    };
    if (s.maxSize > 0) {
        j["maxsize"] = s.maxSize;
    }
    if (s.maxBytes > 0) {
        j["max_memory_mb"] = s.maxMemoryMb();
        j["memory_utilization"] = s.memoryUtilization();
    }
    if (s.secondsSinceLastEviction) {
        j["time_since_last_eviction"] = *s.secondsSinceLastEviction;
    } else {
        j["time_since_last_eviction"] = nullptr;
    }
}

} // namespace folio
