#include <sift/metadata/path_utils.h>

#include <algorithm>
#include <cctype>

namespace sift::metadata {

namespace {
std::string normalizeSlashes(std::string_view path) {
    std::string result(path);
    std::replace(result.begin(), result.end(), '\\', '/');

    size_t b = 0;
    size_t e = result.size();
    while (b < e && std::isspace(static_cast<unsigned char>(result[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(result[e - 1])))
        --e;
    result = result.substr(b, e - b);

    // Collapse repeated separators
    std::string collapsed;
    collapsed.reserve(result.size());
    for (char c : result) {
        if (c == '/' && !collapsed.empty() && collapsed.back() == '/')
            continue;
        collapsed.push_back(c);
    }
    return collapsed;
}
} // namespace

std::string normalizeLogicalPath(std::string_view path) {
    auto result = normalizeSlashes(path);
    if (result.empty())
        return "/";
    if (result.front() != '/')
        result.insert(result.begin(), '/');
    while (result.size() > 1 && result.back() == '/')
        result.pop_back();
    return result;
}

std::string normalizeFolderPrefix(std::string_view path) {
    auto result = normalizeSlashes(path);
    if (result.empty())
        return "/";
    if (result.front() != '/')
        result.insert(result.begin(), '/');
    if (result.back() != '/')
        result.push_back('/');
    return result;
}

std::string fileExtension(std::string_view fileName) {
    auto slash = fileName.find_last_of('/');
    auto base = slash == std::string_view::npos ? fileName : fileName.substr(slash + 1);
    auto dot = base.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0)
        return {};
    std::string ext(base.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string fileNameFromPath(std::string_view path) {
    auto normalized = normalizeLogicalPath(path);
    auto slash = normalized.find_last_of('/');
    return slash == std::string::npos ? normalized : normalized.substr(slash + 1);
}

std::string escapeLikePattern(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '%' || c == '_' || c == '\\')
            out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace sift::metadata
