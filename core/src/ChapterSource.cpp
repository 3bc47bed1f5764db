#include "folio/core/book/ChapterSource.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace folio {

std::string resolveResourcePath(const std::string& href, const std::string& relativeTo)
{
    std::string target = href;
    const auto cut = target.find_first_of("#?");
    if (cut != std::string::npos) {
        target.erase(cut);
    }
    if (target.empty()) {
        return {};
    }

    fs::path resolved;
    if (target.front() == '/') {
        resolved = fs::path(target.substr(1));
    } else {
        resolved = fs::path(relativeTo).parent_path() / fs::path(target);
    }
    resolved = resolved.lexically_normal();

    if (resolved.empty() || *resolved.begin() == "..") {
        return {};
    }
    return resolved.generic_string();
}

} // namespace folio
