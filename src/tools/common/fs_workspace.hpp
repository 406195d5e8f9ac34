//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/fs_workspace.hpp
// Purpose: Workspace implementation backed by the local filesystem.
// Key invariants: Enumeration is sorted and capped; edits are written to a
//                 sibling temporary file and renamed over the target.
// Ownership/Lifetime: Holds only the root path; files are read on demand.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Workspace.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace horder::tools::common
{

/// @brief Suffix of the temporary file used while applying an edit.
inline constexpr std::string_view kTempSuffix = ".horder.tmp";

/// @brief Filesystem workspace rooted at a directory.
class FileSystemWorkspace final : public core::Workspace
{
  public:
    /// @param rootDir Directory enumerated for candidates; relative paths are
    ///        resolved against it as well.
    explicit FileSystemWorkspace(std::string rootDir);

    support::Expected<std::string> readDocumentText(const std::string &path) override;

    /// @details Walks the tree below the root, pruning directories that match
    ///          the exclude glob, tests each regular file's root-relative path
    ///          against include and exclude, sorts the hits and keeps the first
    ///          query.limit of them.
    std::vector<std::string> enumerateCandidateFiles(const core::CandidateQuery &query) override;

    support::Expected<void> applyReplacement(const core::ReplacementPlan &plan) override;

    /// @details Absolute, lexically normal, '/'-separated.
    [[nodiscard]] std::string canonicalPath(std::string_view path) const override;

    [[nodiscard]] const std::string &rootDir() const
    {
        return root_;
    }

  private:
    std::string root_;
};

/// @brief Replace lines [range.start, range.end] of @p text with @p newText.
/// @details The end line's terminator and everything after it are kept, as
///          are the terminators of the lines before the range.
/// @return Edited text, or an error when the range lies outside @p text.
support::Expected<std::string> replaceLineRange(std::string_view text,
                                                const core::LineSpan &range,
                                                std::string_view newText);

} // namespace horder::tools::common
