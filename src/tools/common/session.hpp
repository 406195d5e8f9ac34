//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/session.hpp
// Purpose: Application layer tying the header cache, the workspace and the
//          core heuristics into the scan, find and sync commands.
// Key invariants: The cache is keyed by Workspace::canonicalPath(); failed
//                 operations leave the cache and the workspace untouched.
// Ownership/Lifetime: Borrows every collaborator; the host owns them and
//                     keeps them alive for the session's lifetime.
// Links: core/HeaderCache.hpp, core/Workspace.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/HeaderCache.hpp"
#include "core/Model.hpp"
#include "core/Workspace.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"
#include "tools/common/project_config.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace horder::tools::common
{

/// @brief Message returned when find/sync run before a header was scanned.
inline constexpr std::string_view kNoCachedPrototypesMessage =
    "No cached prototypes — run \"scan\" first.";

/// @brief Outcome of a synchronization request.
struct SyncResult
{
    /// @brief Every body located for the header, across all candidate files.
    std::vector<core::Implementation> implementations;

    /// @brief Edit for the chosen file; empty when nothing in it matched.
    std::optional<core::ReplacementPlan> plan;
};

/// @brief Stateful command layer shared by the one-shot CLI and `session`.
class Session
{
  public:
    Session(core::Workspace &workspace,
            core::HeaderCache &cache,
            support::DiagnosticEngine &diags,
            support::SourceManager &sm,
            ProjectConfig config);

    /// @brief Emit notes for prototypes left out of a plan.
    void setVerbose(bool verbose)
    {
        verbose_ = verbose;
    }

    /// @brief Read and parse @p headerPath, caching the result.
    /// @return Prototypes in declaration order, or an error when the path is
    ///         not a header or cannot be read.
    support::Expected<std::vector<core::Prototype>> scanHeader(const std::string &headerPath);

    /// @brief Parse caller-supplied @p text as the contents of @p headerPath.
    support::Expected<std::vector<core::Prototype>> scanHeaderText(const std::string &headerPath,
                                                                   std::string_view text);

    /// @brief Locate bodies for the cached prototypes of @p headerPath.
    support::Expected<std::vector<core::Implementation>> findImplementations(
        const std::string &headerPath);

    /// @brief Plan the reordering of @p chosenFile to match @p headerPath.
    /// @details Nothing is written; pass the plan to applyPlan().
    support::Expected<SyncResult> synchronizeOrder(const std::string &headerPath,
                                                   const std::string &chosenFile);

    /// @brief Hand @p plan to the workspace.
    support::Expected<void> applyPlan(const core::ReplacementPlan &plan);

    /// @brief Distinct source files of @p implementations in first-seen order.
    [[nodiscard]] static std::vector<std::string> candidateTargets(
        const std::vector<core::Implementation> &implementations);

    /// @brief Forget the cached prototypes of @p headerPath.
    bool invalidate(const std::string &headerPath);

    /// @brief Cached prototypes of @p headerPath, if scanned.
    [[nodiscard]] std::optional<std::vector<core::Prototype>> cached(const std::string &headerPath) const;

    [[nodiscard]] const ProjectConfig &config() const
    {
        return config_;
    }

    [[nodiscard]] core::Workspace &workspace()
    {
        return workspace_;
    }

  private:
    std::vector<core::Implementation> locateAll(const std::vector<core::Prototype> &prototypes);

    void noteUnmatched(const std::string &headerKey,
                       const std::vector<core::Prototype> &prototypes,
                       const core::ReplacementPlan *plan);

    core::Workspace &workspace_;
    core::HeaderCache &cache_;
    support::DiagnosticEngine &diags_;
    support::SourceManager &sm_;
    ProjectConfig config_;
    bool verbose_ = false;
};

} // namespace horder::tools::common
