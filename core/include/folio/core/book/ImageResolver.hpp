#pragma once

#include <string>

namespace folio {

class ChapterSource;

// Turns a chapter's raw markup into displayable markup with its images embedded
class ImageResolver
{
public:
    virtual ~ImageResolver() = default;

    /**
     * Must be idempotent on markup without unresolved relative image
     * references. An image that cannot be found leaves its original tag in
     * place instead of failing the whole chapter.
     */
    virtual std::string resolve(const std::string& html,
                                const ChapterSource& book,
                                const std::string& chapterHref) = 0;
};

} // namespace folio
