#pragma once

#include <string>
#include <string_view>

namespace sift::metadata {

/**
 * @brief Normalize a logical document path: forward slashes, one leading '/',
 * no trailing '/'. Empty input maps to "/".
 */
std::string normalizeLogicalPath(std::string_view path);

/**
 * @brief Normalize a folder prefix used for path filtering: leading and trailing '/'.
 */
std::string normalizeFolderPrefix(std::string_view path);

/**
 * @brief Lowercased extension including the dot, or empty.
 */
std::string fileExtension(std::string_view fileName);

/**
 * @brief Last path segment of a logical path.
 */
std::string fileNameFromPath(std::string_view path);

/**
 * @brief Escape '%', '_' and '\' for use in a LIKE pattern with ESCAPE '\'.
 */
std::string escapeLikePattern(std::string_view value);

} // namespace sift::metadata
