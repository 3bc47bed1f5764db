#pragma once

#include "folio/core/cache/CacheConfig.hpp"

#include <QDir>
#include <QSettings>
#include <QString>

namespace folio::reader {

inline QString settingsFilePath()
{
    const QString homeDir = QDir::homePath();
    const QString configDir = homeDir + "/.Folio";
    QDir dir;
    if (!dir.exists(configDir)) {
        dir.mkpath(configDir);
    }
    return configDir + "/Folio.ini";
}

namespace settings::cache {
constexpr auto RENDERED_MAX_CHAPTERS = "cache/rendered_max_chapters";
constexpr auto RAW_MAX_CHAPTERS = "cache/raw_max_chapters";
constexpr auto IMAGE_MAX_MEMORY_MB = "cache/image_max_memory_mb";
constexpr auto MEMORY_THRESHOLD_MB = "cache/memory_threshold_mb";
} // namespace settings::cache

// Missing keys keep the CacheConfig defaults. The result is not validated.
inline CacheConfig cacheConfigFromSettings(const QSettings& settings)
{
    CacheConfig config;
    config.renderedMaxChapters =
        settings.value(settings::cache::RENDERED_MAX_CHAPTERS, config.renderedMaxChapters).toLongLong();
    config.rawMaxChapters =
        settings.value(settings::cache::RAW_MAX_CHAPTERS, config.rawMaxChapters).toLongLong();
    config.imageMaxMemoryMb =
        settings.value(settings::cache::IMAGE_MAX_MEMORY_MB, config.imageMaxMemoryMb).toDouble();
    config.memoryThresholdMb =
        settings.value(settings::cache::MEMORY_THRESHOLD_MB, config.memoryThresholdMb).toDouble();
    return config;
}

inline CacheConfig cacheConfigFromSettings()
{
    const QSettings settings(settingsFilePath(), QSettings::IniFormat);
    return cacheConfigFromSettings(settings);
}

} // namespace folio::reader
