//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager used by horder sessions.  Headers and candidate
// implementation files are registered when they are read so that warnings
// about unreadable files and notes about unmatched prototypes can be printed
// as "<path>:<line>: ..." lines.
//
//===----------------------------------------------------------------------===//

#include "source_manager.hpp"

#include "support/diag_expected.hpp"
#include "support/path_utils.hpp"

#include <iostream>
#include <limits>

namespace horder::support
{

/// @brief Register a file path and assign it a stable identifier.
///
/// @details Paths are normalized with @ref normalizePath first, so "a/./b.cpp"
///          and "a/b.cpp" share an identifier.  Identifiers start at one,
///          leaving zero for "unknown".
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(path);

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string{kSourceManagerFileIdOverflowMessage});
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

uint32_t SourceManager::findFile(std::string_view path) const
{
    auto it = path_to_id_.find(normalizePath(path));
    return it == path_to_id_.end() ? 0 : it->second;
}

} // namespace horder::support
