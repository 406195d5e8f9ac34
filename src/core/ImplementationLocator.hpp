//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/ImplementationLocator.hpp
// Purpose: Finds function bodies for known names across candidate files.
// Key invariants: Results follow file order, then line order, then name order;
//                 every span closes a balanced brace region.
// Ownership/Lifetime: Borrows the Workspace and optional diagnostics sinks;
//                     results are owned by the caller.
// Links: core/Workspace.hpp, core/LineScan.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Model.hpp"
#include "core/Workspace.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace horder::support
{
class DiagnosticEngine;
class SourceManager;
} // namespace horder::support

namespace horder::core
{

/// @brief Locates definitions by substring match plus brace-depth scanning.
///
/// A line that contains `name(` (comment-only lines excepted) starts a
/// candidate.  It is a definition when a '{' shows up within
/// @ref kBraceSearchWindow lines before any line ending in ';'.  The body ends
/// where the flat brace counter returns to zero.  There is no identifier
/// boundary check, so `name(` also hits inside `rename(`.
class ImplementationLocator
{
  public:
    /// @brief Lines searched, starting at the match, for the opening brace.
    static constexpr std::size_t kBraceSearchWindow = 30;

    /// @param workspace Source of file text.
    /// @param diags Optional sink for warnings about unreadable files.
    /// @param sm Optional manager used to attach file locations to warnings.
    explicit ImplementationLocator(Workspace &workspace,
                                   support::DiagnosticEngine *diags = nullptr,
                                   support::SourceManager *sm = nullptr);

    /// @brief Scan @p files for bodies of @p names.
    /// @details Returns immediately, without reading anything, when @p names is
    ///          empty.  Files that cannot be read are skipped with a warning.
    [[nodiscard]] std::vector<Implementation> locate(const std::vector<std::string> &names,
                                                     const std::vector<std::string> &files);

    /// @brief Scan a single in-memory document.
    /// @param names Names to look for; duplicates are ignored.
    /// @param text Document contents.
    /// @param file Value stored in Implementation::sourceFile.
    [[nodiscard]] static std::vector<Implementation> locateInText(const std::vector<std::string> &names,
                                                                  std::string_view text,
                                                                  const std::string &file);

    /// @brief Distinct names of @p prototypes in first-declaration order.
    [[nodiscard]] static std::vector<std::string> uniqueNames(const std::vector<Prototype> &prototypes);

  private:
    Workspace &workspace_;
    support::DiagnosticEngine *diags_;
    support::SourceManager *sm_;
};

} // namespace horder::core
