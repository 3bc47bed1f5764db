#pragma once

#include <nlohmann/json_fwd.hpp>

#include <filesystem>

namespace folio {

// Budgets for the three cache layers and the memory monitor.
struct CacheConfig {
    long long renderedMaxChapters = 10;
    long long rawMaxChapters = 20;
    double imageMaxMemoryMb = 50.0;
    double memoryThresholdMb = 150.0;

    // Throws ConfigurationError naming the first invalid parameter
    void validate() const;
};

void to_json(nlohmann::json& j, const CacheConfig& c);

// Missing keys keep their defaults; bad types or values throw ConfigurationError
void from_json(const nlohmann::json& j, CacheConfig& c);

CacheConfig loadCacheConfig(const std::filesystem::path& path);

} // namespace folio
