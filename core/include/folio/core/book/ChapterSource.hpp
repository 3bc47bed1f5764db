#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Read access to one open book
 *
 * Implementations must be safe to call from a background loader while the
 * UI thread holds the same book.
 */
class ChapterSource
{
public:
    virtual ~ChapterSource() = default;

    // Stable identity used to namespace cache keys (the absolute file path)
    virtual std::string identity() const = 0;

    virtual int chapterCount() const = 0;

    /**
     * @throws NotFoundError if index is out of range
     * @throws CorruptedContentError if the entry cannot be read
     */
    virtual std::string chapterContent(int index) const = 0;

    // Path of the chapter document inside the book, used to resolve relative resources
    virtual std::string chapterHref(int index) const = 0;

    /**
     * @brief Raw bytes of a resource referenced from a document
     * @param href Reference as written in the document
     * @param relativeTo Href of the referencing document, empty for the book root
     * @throws CorruptedContentError if the resource does not exist or cannot be read
     */
    virtual std::vector<uint8_t> resource(const std::string& href, const std::string& relativeTo) const = 0;
};

// Resolves `href` against the directory of `relativeTo` and normalises it.
// Returns an empty string when the result would leave the book root.
std::string resolveResourcePath(const std::string& href, const std::string& relativeTo);

} // namespace folio
