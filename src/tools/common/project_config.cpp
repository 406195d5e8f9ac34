//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/project_config.cpp
// Purpose: horder.project manifest parsing and workspace root resolution.
//
//===----------------------------------------------------------------------===//

#include "tools/common/project_config.hpp"

#include "support/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace horder::tools::common
{

namespace
{

support::Diag makeErr(const std::string &msg)
{
    return support::makeError({}, msg);
}

/// @brief Make a diagnostic error with file:line context.
support::Diag makeManifestErr(const std::string &path, int line, const std::string &msg)
{
    return support::makeError({}, path + ":" + std::to_string(line) + ": " + msg);
}

support::Expected<std::size_t> parseLimit(const std::string &value,
                                          const std::string &manifestPath,
                                          int line)
{
    std::size_t parsed = 0;
    const char *begin = value.data();
    const char *end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end || parsed == 0)
        return makeManifestErr(manifestPath, line,
                               "invalid limit '" + value + "'; expected a positive integer");
    return parsed;
}

std::string lowerExtension(std::string ext)
{
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (!ext.empty() && ext.front() != '.')
        ext.insert(ext.begin(), '.');
    return ext;
}

} // anonymous namespace

support::Expected<ProjectConfig> parseManifest(const std::string &manifestPath, ProjectConfig base)
{
    std::ifstream file(manifestPath);
    if (!file.is_open())
        return makeErr("cannot open manifest: " + manifestPath);

    ProjectConfig config = std::move(base);
    config.manifestPath = support::normalizePath(manifestPath);

    bool hasInclude = false;
    bool hasExclude = false;
    bool hasLimit = false;
    bool hasHeaderExt = false;

    std::string line;
    int lineNum = 0;
    while (std::getline(file, line))
    {
        ++lineNum;

        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos)
            continue;
        line = line.substr(start);
        auto end = line.find_last_not_of(" \t\r\n");
        if (end != std::string::npos)
            line = line.substr(0, end + 1);

        if (line.empty() || line[0] == '#')
            continue;

        auto spacePos = line.find_first_of(" \t");
        if (spacePos == std::string::npos)
            return makeManifestErr(manifestPath, lineNum, "directive missing value: '" + line + "'");

        std::string directive = line.substr(0, spacePos);
        std::string value = line.substr(line.find_first_not_of(" \t", spacePos));

        if (directive == "include")
        {
            if (hasInclude)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'include'");
            hasInclude = true;
            config.candidates.include = value;
        }
        else if (directive == "exclude")
        {
            if (hasExclude)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'exclude'");
            hasExclude = true;
            config.candidates.exclude = value;
        }
        else if (directive == "limit")
        {
            if (hasLimit)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'limit'");
            hasLimit = true;
            auto limit = parseLimit(value, manifestPath, lineNum);
            if (!limit)
                return support::Expected<ProjectConfig>(limit.error());
            config.candidates.limit = limit.value();
        }
        else if (directive == "header-ext")
        {
            if (!hasHeaderExt)
                config.headerExtensions.clear();
            hasHeaderExt = true;
            config.headerExtensions.push_back(lowerExtension(value));
        }
        else
        {
            return makeManifestErr(manifestPath, lineNum, "unknown directive '" + directive + "'");
        }
    }

    return config;
}

support::Expected<ProjectConfig> resolveProject(const std::string &rootDir, const std::string &manifestPath)
{
    fs::path root(rootDir.empty() ? std::string{"."} : rootDir);
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        return makeErr("workspace root is not a directory: " + root.string());

    root = fs::weakly_canonical(fs::absolute(root, ec), ec);
    if (ec)
        return makeErr("cannot resolve workspace root " + rootDir + ": " + ec.message());

    ProjectConfig config;
    config.rootDir = support::normalizePath(root.generic_string());

    if (!manifestPath.empty())
        return parseManifest(manifestPath, std::move(config));

    const fs::path implicitManifest = root / std::string(kManifestFileName);
    if (fs::is_regular_file(implicitManifest, ec))
        return parseManifest(implicitManifest.string(), std::move(config));

    return config;
}

bool isHeaderPath(std::string_view path, const ProjectConfig &config)
{
    const std::string ext = support::extensionOf(path);
    if (ext.empty())
        return false;
    return std::find(config.headerExtensions.begin(), config.headerExtensions.end(), ext) !=
           config.headerExtensions.end();
}

} // namespace horder::tools::common
