//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Workspace.hpp
// Purpose: Abstract host capabilities the core consumes: read a document,
//          enumerate candidate implementation files, apply a line-range edit.
// Key invariants: Paths returned by enumerateCandidateFiles() are already in
//                 canonicalPath() form.
// Ownership/Lifetime: Implementations are owned by the host and outlive every
//                     component that borrows them.
// Links: tools/common/fs_workspace.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Model.hpp"
#include "support/diag_expected.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace horder::core
{

/// @brief Default glob selecting implementation files.
inline constexpr std::string_view kDefaultCandidateGlob = "**/*.{cpp,cc,cxx,c,hpp,ccpp}";

/// @brief Default glob of paths never scanned.
inline constexpr std::string_view kDefaultExcludeGlob = "**/node_modules/**";

/// @brief Default cap on the number of candidate files.
inline constexpr std::size_t kDefaultCandidateLimit = 200;

/// @brief Parameters of a candidate-file enumeration.
struct CandidateQuery
{
    std::string include{kDefaultCandidateGlob};
    std::string exclude{kDefaultExcludeGlob};
    std::size_t limit = kDefaultCandidateLimit;
};

/// @brief Document store and editor capabilities supplied by the host.
class Workspace
{
  public:
    virtual ~Workspace() = default;

    /// @brief Current text of the document at @p path.
    /// @return Text, or an error diagnostic when it cannot be read.
    virtual support::Expected<std::string> readDocumentText(const std::string &path) = 0;

    /// @brief Files matching @p query, in a stable order, at most query.limit.
    virtual std::vector<std::string> enumerateCandidateFiles(const CandidateQuery &query) = 0;

    /// @brief Replace lines plan.range of plan.file with plan.newText and save.
    /// @details All-or-nothing: on error the document is left unchanged.
    virtual support::Expected<void> applyReplacement(const ReplacementPlan &plan) = 0;

    /// @brief Identity of @p path used for cache keys and file comparison.
    [[nodiscard]] virtual std::string canonicalPath(std::string_view path) const = 0;
};

} // namespace horder::core
