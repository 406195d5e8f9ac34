//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/fs_workspace.cpp
// Purpose: Filesystem-backed candidate enumeration, document reads and
//          all-or-nothing line-range edits.
//
//===----------------------------------------------------------------------===//

#include "tools/common/fs_workspace.hpp"

#include "support/glob.hpp"
#include "support/path_utils.hpp"
#include "tools/common/source_loader.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace horder::tools::common
{

namespace
{

/// @brief Byte offsets of the start of each line, plus text.size() at the end.
std::vector<std::size_t> lineStarts(std::string_view text)
{
    std::vector<std::size_t> starts{0};
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n')
            starts.push_back(i + 1);
    }
    return starts;
}

/// @brief Offset just past the visible content of the line starting at @p begin.
std::size_t contentEnd(std::string_view text, std::size_t begin)
{
    std::size_t nl = text.find('\n', begin);
    if (nl == std::string_view::npos)
        return text.size();
    if (nl > begin && text[nl - 1] == '\r')
        --nl;
    return nl;
}

} // namespace

support::Expected<std::string> replaceLineRange(std::string_view text,
                                                const core::LineSpan &range,
                                                std::string_view newText)
{
    const std::vector<std::size_t> starts = lineStarts(text);
    if (range.start > range.end || range.end >= starts.size())
    {
        return support::makeError({},
                                  "line range " + std::to_string(range.start + 1) + "-" +
                                      std::to_string(range.end + 1) + " is outside the document (" +
                                      std::to_string(starts.size()) + " lines)");
    }

    const std::size_t cutBegin = starts[range.start];
    const std::size_t cutEnd = contentEnd(text, starts[range.end]);

    std::string out;
    out.reserve(text.size() - (cutEnd - cutBegin) + newText.size());
    out.append(text.substr(0, cutBegin));
    out.append(newText);
    out.append(text.substr(cutEnd));
    return out;
}

FileSystemWorkspace::FileSystemWorkspace(std::string rootDir)
    : root_(support::normalizePath(fs::absolute(fs::path(rootDir.empty() ? "." : rootDir)).generic_string()))
{
}

std::string FileSystemWorkspace::canonicalPath(std::string_view path) const
{
    fs::path p{std::string(path)};
    if (p.is_relative())
        p = fs::path(root_) / p;
    return support::normalizePath(p.generic_string());
}

support::Expected<std::string> FileSystemWorkspace::readDocumentText(const std::string &path)
{
    return loadSourceFile(canonicalPath(path));
}

std::vector<std::string> FileSystemWorkspace::enumerateCandidateFiles(const core::CandidateQuery &query)
{
    std::vector<std::string> result;
    const support::GlobPattern include(query.include);
    const support::GlobPattern exclude(query.exclude);
    if (include.empty() || query.limit == 0)
        return result;

    const fs::path root(root_);
    std::error_code ec;
    if (!fs::is_directory(root, ec))
        return result;

    for (auto it = fs::recursive_directory_iterator(root, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator();
         it.increment(ec))
    {
        const std::string rel = support::relativeTo(it->path().generic_string(), root_);

        if (it->is_directory(ec))
        {
            if (!exclude.empty() && exclude.matches(rel + "/"))
                it.disable_recursion_pending();
            continue;
        }

        if (!it->is_regular_file(ec))
            continue;
        if (!include.matches(rel))
            continue;
        if (!exclude.empty() && exclude.matches(rel))
            continue;
        result.push_back(canonicalPath(rel));
    }

    std::sort(result.begin(), result.end());
    if (result.size() > query.limit)
        result.resize(query.limit);
    return result;
}

support::Expected<void> FileSystemWorkspace::applyReplacement(const core::ReplacementPlan &plan)
{
    const std::string target = canonicalPath(plan.file);

    auto current = loadSourceFile(target);
    if (!current)
        return support::Expected<void>(current.error());

    auto edited = replaceLineRange(current.value(), plan.range, plan.newText);
    if (!edited)
        return support::Expected<void>(edited.error());

    const std::string tempPath = target + std::string(kTempSuffix);
    {
        std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
        if (!out)
            return support::Expected<void>(support::makeError({}, "could not write " + tempPath));
        out << edited.value();
        out.flush();
        if (!out)
        {
            out.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            return support::Expected<void>(support::makeError({}, "could not write " + tempPath));
        }
    }

    std::error_code ec;
    fs::rename(tempPath, target, ec);
    if (ec)
    {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return support::Expected<void>(
            support::makeError({}, "could not replace " + target + ": " + ec.message()));
    }
    return {};
}

} // namespace horder::tools::common
