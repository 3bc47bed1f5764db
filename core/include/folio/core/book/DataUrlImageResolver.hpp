#pragma once

#include "folio/core/book/ImageResolver.hpp"
#include "folio/core/util/Logging.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace folio {

class MemoryBoundedCache;

// Inline style that keeps embedded images inside the viewport
constexpr const char* kResponsiveImageStyle =
    "max-width: 100%; max-height: 90vh; width: auto; height: auto; object-fit: contain;";

// MIME type from the file extension, image/jpeg when unknown
std::string imageMimeType(const std::string& path);

std::string base64Encode(const std::vector<uint8_t>& data);

/**
 * @brief Shrinks a raster image to fit maxWidth x maxHeight, keeping aspect ratio
 *
 * Returns the input unchanged if it already fits or cannot be decoded or
 * re-encoded.
 */
std::vector<uint8_t> downscaleImage(const std::vector<uint8_t>& data,
                                    const std::string& path,
                                    int maxWidth = 1920,
                                    int maxHeight = 1080,
                                    MinimalLogger* log = nullptr);

/**
 * @brief Embeds relative <img> sources as base64 data URLs
 *
 * data:, http:// and https:// sources are left alone. Encoded payloads are
 * kept in an optional image cache keyed by "<book identity>::<resolved path>"
 * so two books with the same resource path never share an entry.
 */
class DataUrlImageResolver final : public ImageResolver
{
public:
    explicit DataUrlImageResolver(MemoryBoundedCache* imageCache = nullptr,
                                  std::shared_ptr<MinimalLogger> log = nullptr);

    std::string resolve(const std::string& html,
                        const ChapterSource& book,
                        const std::string& chapterHref) override;

    void setMaxImageSize(int maxWidth, int maxHeight);

    static std::string imageCacheKey(const std::string& bookIdentity, const std::string& resolvedPath);

private:
    // Returns the data URL for src, or an empty string if the image is missing
    std::string dataUrlFor(const std::string& src, const ChapterSource& book, const std::string& chapterHref);

    MemoryBoundedCache* _imageCache;
    std::shared_ptr<MinimalLogger> _log;
    int _maxWidth = 1920;
    int _maxHeight = 1080;
};

} // namespace folio
