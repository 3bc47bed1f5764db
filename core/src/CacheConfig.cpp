#include "folio/core/cache/CacheConfig.hpp"

#include "folio/core/util/Errors.hpp"
#include "folio/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <string>

namespace folio {

void CacheConfig::validate() const
{
    if (renderedMaxChapters < 1) {
        throw ConfigurationError("rendered_max_chapters must be at least 1 (got " +
                                 std::to_string(renderedMaxChapters) + ")");
    }
    if (rawMaxChapters < 1) {
        throw ConfigurationError("raw_max_chapters must be at least 1 (got " +
                                 std::to_string(rawMaxChapters) + ")");
    }
    if (!std::isfinite(imageMaxMemoryMb) || imageMaxMemoryMb <= 0.0) {
        throw ConfigurationError("image_max_memory_mb must be positive (got " +
                                 std::to_string(imageMaxMemoryMb) + ")");
    }
    if (!std::isfinite(memoryThresholdMb) || memoryThresholdMb <= 0.0) {
        throw ConfigurationError("memory_threshold_mb must be positive (got " +
                                 std::to_string(memoryThresholdMb) + ")");
    }
}

void to_json(nlohmann::json& j, const CacheConfig& c)
{
    j = nlohmann::json{
        {"rendered_max_chapters", c.renderedMaxChapters},
        {"raw_max_chapters", c.rawMaxChapters},
        {"image_max_memory_mb", c.imageMaxMemoryMb},
        {"memory_threshold_mb", c.memoryThresholdMb},
    };
}

void from_json(const nlohmann::json& j, CacheConfig& c)
{
    if (!j.is_object()) {
        throw ConfigurationError("cache config must be a JSON object");
    }
    const std::string context = "cache config";
    try {
        c.renderedMaxChapters = json::integer_or(j, "rendered_max_chapters", c.renderedMaxChapters, context);
        c.rawMaxChapters = json::integer_or(j, "raw_max_chapters", c.rawMaxChapters, context);
        c.imageMaxMemoryMb = json::number_or(j, "image_max_memory_mb", c.imageMaxMemoryMb, context);
        c.memoryThresholdMb = json::number_or(j, "memory_threshold_mb", c.memoryThresholdMb, context);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const Error& e) {
        throw ConfigurationError(e.what());
    }
    c.validate();
}

CacheConfig loadCacheConfig(const std::filesystem::path& path)
{
    nlohmann::json j;
    try {
        j = json::load_json_file(path);
    } catch (const Error& e) {
        throw ConfigurationError(e.what());
    }
    CacheConfig config;
    from_json(j, config);
    return config;
}

} // namespace folio
