#include "folio/core/book/DirectoryBook.hpp"

#include "folio/core/util/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace folio {

namespace {

bool isChapterDocument(const fs::path& p)
{
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".xhtml" || ext == ".html" || ext == ".htm";
}

} // namespace

DirectoryBook::DirectoryBook(const fs::path& root)
{
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw NotFoundError("Book directory does not exist: " + root.string());
    }
    _root = fs::canonical(root);
    _identity = _root.string();

    for (const auto& entry : fs::recursive_directory_iterator(_root)) {
        if (entry.is_regular_file() && isChapterDocument(entry.path())) {
            _chapters.push_back(entry.path().lexically_relative(_root).generic_string());
        }
    }
    std::sort(_chapters.begin(), _chapters.end());
}

void DirectoryBook::checkIndex(int index) const
{
    if (index < 0 || index >= chapterCount()) {
        throw NotFoundError("Chapter index " + std::to_string(index) + " out of range (book has " +
                            std::to_string(chapterCount()) + " chapters)");
    }
}

std::string DirectoryBook::chapterHref(int index) const
{
    checkIndex(index);
    return _chapters[static_cast<size_t>(index)];
}

std::string DirectoryBook::chapterContent(int index) const
{
    checkIndex(index);
    const fs::path path = _root / _chapters[static_cast<size_t>(index)];
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CorruptedContentError("Cannot read chapter file: " + path.string());
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        throw CorruptedContentError("Error while reading chapter file: " + path.string());
    }
    return oss.str();
}

std::vector<uint8_t> DirectoryBook::resource(const std::string& href, const std::string& relativeTo) const
{
    const std::string resolved = resolveResourcePath(href, relativeTo);
    if (resolved.empty()) {
        throw CorruptedContentError("Resource path outside of book: " + href);
    }

    const fs::path path = _root / resolved;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw CorruptedContentError("Resource not found in book: " + resolved);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CorruptedContentError("Cannot read resource: " + resolved);
    }
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace folio
