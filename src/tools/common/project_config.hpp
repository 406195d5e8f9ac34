//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/project_config.hpp
// Purpose: Workspace configuration for horder: root directory, candidate-file
//          globs and limit, header extensions, read from an optional
//          horder.project manifest.
// Key invariants: After successful resolution rootDir is an absolute,
//                 normalized directory path and candidates.limit > 0.
// Ownership/Lifetime: Caller owns the returned ProjectConfig.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Workspace.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace horder::tools::common
{

/// @brief Manifest looked up in the workspace root when none is given.
inline constexpr std::string_view kManifestFileName = "horder.project";

/// @brief Resolved workspace configuration.
struct ProjectConfig
{
    /// @brief Absolute path of the directory scanned for implementations.
    std::string rootDir;

    /// @brief Manifest that contributed to this config; empty when none.
    std::string manifestPath;

    /// @brief Include/exclude globs and file cap for candidate enumeration.
    core::CandidateQuery candidates{};

    /// @brief Extensions (lower case, with dot) accepted as headers.
    std::vector<std::string> headerExtensions{".h", ".hh", ".hpp", ".hxx"};
};

/// @brief Apply the directives of a horder.project manifest on top of @p base.
///
/// The manifest is line based: blank lines and lines starting with '#' are
/// ignored, every other line is `directive value`.  Directives:
/// - `include <glob>`     candidate include glob (once)
/// - `exclude <glob>`     candidate exclude glob (once)
/// - `limit <N>`          candidate cap, N > 0 (once)
/// - `header-ext <.ext>`  header extension; the first occurrence replaces the
///                        defaults, later ones append
///
/// @return Updated config, or an error "path:line: message".
support::Expected<ProjectConfig> parseManifest(const std::string &manifestPath, ProjectConfig base);

/// @brief Resolve the configuration for workspace root @p rootDir.
/// @param rootDir Directory to scan; "." when empty.
/// @param manifestPath Explicit manifest; when empty, rootDir/horder.project
///        is used if it exists.
support::Expected<ProjectConfig> resolveProject(const std::string &rootDir,
                                                const std::string &manifestPath = {});

/// @brief Whether @p path names a header according to @p config.
[[nodiscard]] bool isHeaderPath(std::string_view path, const ProjectConfig &config);

} // namespace horder::tools::common
