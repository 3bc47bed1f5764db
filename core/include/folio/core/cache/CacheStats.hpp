#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace folio {

constexpr double kBytesPerMb = 1024.0 * 1024.0;

// Per-string bookkeeping charged on top of the payload bytes
constexpr std::size_t kStringOverheadBytes = sizeof(std::string) + 1;

// Estimated footprint of a cached string value: deterministic for equal
// inputs and non-decreasing in length.
inline std::size_t estimateBytes(const std::string& value) noexcept
{
    return kStringOverheadBytes + value.size();
}

// Snapshot of one cache's counters.
// maxSize is set for count-bounded caches, maxBytes for memory-bounded ones.
struct CacheStats {
    std::size_t size = 0;
    std::size_t maxSize = 0;
    std::size_t maxBytes = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    std::size_t estimatedBytes = 0;
    std::optional<double> secondsSinceLastEviction;
    double ageSeconds = 0.0;

    // Percentage, 0.0 when nothing was looked up yet
    double hitRate() const noexcept
    {
        const uint64_t total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) * 100.0 : 0.0;
    }

    double memoryMb() const noexcept { return static_cast<double>(estimatedBytes) / kBytesPerMb; }
    double maxMemoryMb() const noexcept { return static_cast<double>(maxBytes) / kBytesPerMb; }

    double averageItemBytes() const noexcept
    {
        return size > 0 ? static_cast<double>(estimatedBytes) / static_cast<double>(size) : 0.0;
    }

    // Percentage of the byte budget in use; 0.0 for count-bounded caches
    double memoryUtilization() const noexcept
    {
        return maxBytes > 0 ? static_cast<double>(estimatedBytes) / static_cast<double>(maxBytes) * 100.0 : 0.0;
    }
};

void to_json(nlohmann::json& j, const CacheStats& s);

namespace detail {

using SteadyClock = std::chrono::steady_clock;

inline double secondsSince(SteadyClock::time_point tp)
{
    return std::chrono::duration<double>(SteadyClock::now() - tp).count();
}

} // namespace detail

} // namespace folio
