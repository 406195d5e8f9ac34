// File: src/support/path_utils.cpp
// Purpose: Implement helpers for normalizing and comparing file paths.
// Key invariants: Normalization always yields forward slashes and resolves dot
// segments.
// Ownership/Lifetime: Stateless.
// Links: support/path_utils.hpp

#include "support/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace horder::support
{

std::string normalizePath(std::string_view path)
{
    std::string sanitized(path);
    std::replace(sanitized.begin(), sanitized.end(), '\\', '/');

    if (sanitized.empty())
        return std::string{"."};

    std::filesystem::path fsPath(sanitized);
    std::string generic = fsPath.lexically_normal().generic_string();

    if (generic.empty())
        generic = sanitized.front() == '/' ? std::string{"/"} : std::string{"."};

    // lexically_normal keeps a trailing separator for "dir/"; drop it.
    if (generic.size() > 1 && generic.back() == '/')
        generic.pop_back();

    return generic;
}

std::string basename(std::string_view path)
{
    if (path.empty())
        return {};
    size_t pos = path.find_last_of('/');
    if (pos == std::string_view::npos)
        return std::string(path);
    if (pos + 1 >= path.size())
        return {};
    return std::string(path.substr(pos + 1));
}

std::string extensionOf(std::string_view path)
{
    const std::string base = basename(normalizePath(path));
    const size_t dot = base.find_last_of('.');
    if (dot == std::string::npos || dot == 0)
        return {};
    std::string ext = base.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return ext;
}

std::string relativeTo(std::string_view path, std::string_view root)
{
    const std::string normPath = normalizePath(path);
    const std::string normRoot = normalizePath(root);
    if (normRoot == ".")
        return normPath;
    if (normPath == normRoot)
        return std::string{"."};
    const std::string prefix = normRoot == "/" ? normRoot : normRoot + "/";
    if (normPath.compare(0, prefix.size(), prefix) == 0)
        return normPath.substr(prefix.size());
    return normPath;
}

} // namespace horder::support
