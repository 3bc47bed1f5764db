#pragma once

#include "folio/core/book/ChapterSource.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace folio {

/**
 * @brief Book backed by an extracted book directory
 *
 * Chapters are the .xhtml/.html/.htm files below the root, ordered by their
 * relative path. Resources are plain files below the root.
 */
class DirectoryBook final : public ChapterSource
{
public:
    // Throws NotFoundError if root is not a directory
    explicit DirectoryBook(const std::filesystem::path& root);

    std::string identity() const override { return _identity; }
    int chapterCount() const override { return static_cast<int>(_chapters.size()); }
    std::string chapterContent(int index) const override;
    std::string chapterHref(int index) const override;
    std::vector<uint8_t> resource(const std::string& href, const std::string& relativeTo) const override;

    const std::filesystem::path& root() const { return _root; }

private:
    void checkIndex(int index) const;

    std::filesystem::path _root;
    std::string _identity;
    std::vector<std::string> _chapters;
};

} // namespace folio
