#include "folio/core/book/DataUrlImageResolver.hpp"

#include "folio/core/book/ChapterSource.hpp"
#include "folio/core/cache/MemoryBoundedCache.hpp"
#include "folio/core/util/Errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string_view>

namespace fs = std::filesystem;

namespace folio {

namespace {

std::string lowerExtension(const std::string& path)
{
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool startsWithNoCase(const std::string& s, const std::string& prefix)
{
    if (s.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

std::string lowered(const std::string& s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Positions inside one <img ...> tag. The tag spans [open, close]; the
// attribute text before src= starts at attrs, the quoted value is
// [value, valueEnd) and the remainder runs from valueEnd + 1 to close.
struct ImgTag {
    size_t open = 0;
    size_t attrs = 0;
    size_t srcAttr = 0;
    size_t value = 0;
    size_t valueEnd = 0;
    size_t close = 0;
};

// Finds the first src="..." or src='...' between `from` and `close`. The
// value must be non-empty and may not contain either quote character.
bool findSrc(const std::string& html, const std::string& lower, size_t from, ImgTag& tag)
{
    const std::string_view inTag = std::string_view(lower).substr(0, tag.close);
    size_t pos = inTag.find("src=", from);
    while (pos != std::string_view::npos && pos + 4 < tag.close) {
        const char quote = html[pos + 4];
        if (quote == '"' || quote == '\'') {
            const size_t end = html.find_first_of("\"'", pos + 5);
            if (end != std::string::npos && end < tag.close && end > pos + 5 && html[end] == quote) {
                tag.srcAttr = pos;
                tag.value = pos + 5;
                tag.valueEnd = end;
                return true;
            }
        }
        pos = inTag.find("src=", pos + 1);
    }
    return false;
}

bool isExternalSource(const std::string& src)
{
    return startsWithNoCase(src, "data:") || startsWithNoCase(src, "http://") ||
           startsWithNoCase(src, "https://");
}

} // namespace

std::string imageMimeType(const std::string& path)
{
    const std::string ext = lowerExtension(path);
    if (ext == ".png") return "image/png";
    if (ext == ".gif") return "image/gif";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".webp") return "image/webp";
    if (ext == ".bmp") return "image/bmp";
    return "image/jpeg";
}

std::string base64Encode(const std::vector<uint8_t>& data)
{
    static const char* chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve((data.size() + 2) / 3 * 4);
    int val = 0, valb = -6;
    for (uint8_t c : data) {
        val = ((val << 8) + c) & 0xFFFF;
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) encoded.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (encoded.size() % 4) encoded.push_back('=');
    return encoded;
}

std::vector<uint8_t> downscaleImage(const std::vector<uint8_t>& data,
                                    const std::string& path,
                                    int maxWidth,
                                    int maxHeight,
                                    MinimalLogger* log)
{
    const std::string ext = lowerExtension(path);
    if (ext == ".svg" || data.empty() || maxWidth <= 0 || maxHeight <= 0) {
        return data;
    }

    cv::Mat img;
    try {
        img = cv::imdecode(cv::Mat(1, static_cast<int>(data.size()), CV_8UC1, const_cast<uint8_t*>(data.data())),
                           cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        if (log) log->warn("Could not decode image {}: {}", path, e.what());
        return data;
    }
    if (img.empty()) {
        return data;
    }
    if (img.cols <= maxWidth && img.rows <= maxHeight) {
        return data;
    }

    const double scale = std::min(static_cast<double>(maxWidth) / img.cols,
                                  static_cast<double>(maxHeight) / img.rows);
    const cv::Size target(std::max(1, static_cast<int>(img.cols * scale)),
                          std::max(1, static_cast<int>(img.rows * scale)));

    cv::Mat resized;
    cv::resize(img, resized, target, 0, 0, cv::INTER_AREA);

    std::vector<uint8_t> out;
    const std::string encodeExt = ext.empty() ? std::string(".jpg") : ext;
    try {
        if (!cv::imencode(encodeExt, resized, out)) {
            return data;
        }
    } catch (const cv::Exception& e) {
        if (log) log->warn("Could not re-encode image {}: {}", path, e.what());
        return data;
    }

    if (log) {
        log->debug("Downscaled {} from {}x{} to {}x{}", path, img.cols, img.rows, target.width, target.height);
    }
    return out;
}

DataUrlImageResolver::DataUrlImageResolver(MemoryBoundedCache* imageCache, std::shared_ptr<MinimalLogger> log)
    : _imageCache(imageCache), _log(LoggerOr(std::move(log)))
{
}

void DataUrlImageResolver::setMaxImageSize(int maxWidth, int maxHeight)
{
    _maxWidth = maxWidth;
    _maxHeight = maxHeight;
}

std::string DataUrlImageResolver::imageCacheKey(const std::string& bookIdentity, const std::string& resolvedPath)
{
    return bookIdentity + "::" + resolvedPath;
}

std::string DataUrlImageResolver::dataUrlFor(const std::string& src,
                                             const ChapterSource& book,
                                             const std::string& chapterHref)
{
    const std::string resolved = resolveResourcePath(src, chapterHref);
    if (resolved.empty()) {
        _log->warn("Image path escapes the book: {}", src);
        return {};
    }

    const std::string key = imageCacheKey(book.identity(), resolved);
    if (_imageCache) {
        if (auto cached = _imageCache->get(key)) {
            return *cached;
        }
    }

    std::vector<uint8_t> bytes;
    try {
        bytes = book.resource(src, chapterHref);
    } catch (const CorruptedContentError& e) {
        _log->warn("Image not found in book: {} ({})", resolved, e.what());
        return {};
    }

    bytes = downscaleImage(bytes, resolved, _maxWidth, _maxHeight, _log.get());
    std::string url = "data:" + imageMimeType(resolved) + ";base64," + base64Encode(bytes);

    if (_imageCache) {
        _imageCache->set(key, url);
    }
    return url;
}

std::string DataUrlImageResolver::resolve(const std::string& html,
                                          const ChapterSource& book,
                                          const std::string& chapterHref)
{
    // Single forward pass; data URLs can run to megabytes, so nothing here
    // may backtrack or recurse per character.
    const std::string lower = lowered(html);

    std::string out;
    out.reserve(html.size());

    size_t last = 0;
    size_t pos = 0;
    int embedded = 0;

    while ((pos = lower.find("<img", pos)) != std::string::npos) {
        ImgTag tag;
        tag.open = pos;
        tag.attrs = pos + 4;
        if (tag.attrs >= html.size() || !isSpace(html[tag.attrs])) {
            pos = tag.attrs;
            continue;
        }
        while (tag.attrs < html.size() && isSpace(html[tag.attrs])) {
            ++tag.attrs;
        }

        tag.close = html.find('>', tag.attrs);
        if (tag.close == std::string::npos) {
            break;
        }
        pos = tag.close + 1;

        if (!findSrc(html, lower, tag.attrs, tag)) {
            continue;
        }

        const std::string src = html.substr(tag.value, tag.valueEnd - tag.value);
        if (isExternalSource(src)) {
            continue;
        }

        const std::string url = dataUrlFor(src, book, chapterHref);
        if (url.empty()) {
            continue;
        }

        out.append(html, last, tag.open - last);
        out += "<img ";
        out.append(html, tag.attrs, tag.srcAttr - tag.attrs);
        out += "src=\"" + url + "\" style=\"" + kResponsiveImageStyle + "\"";
        out.append(html, tag.valueEnd + 1, tag.close - tag.valueEnd - 1);
        out += ">";
        last = tag.close + 1;
        ++embedded;
    }
    out.append(html, last, std::string::npos);

    if (embedded > 0) {
        _log->debug("Embedded {} images in {}", embedded, chapterHref);
    }
    return out;
}

} // namespace folio
