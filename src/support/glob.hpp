//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/glob.hpp
// Purpose: Path glob matching for candidate-file enumeration.
// Key invariants: Patterns and paths use '/' separators; matching is case-sensitive.
// Ownership/Lifetime: GlobPattern owns its expanded alternatives.
// Links: tools/common/fs_workspace.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace horder::support
{

/// @brief Compiled glob pattern.
///
/// Supported syntax:
/// - `**`   any sequence of characters including '/'; `**/` also matches
///          zero directories, so "**/*.cpp" matches "a.cpp".
/// - `*`    any sequence of characters except '/'.
/// - `?`    one character except '/'.
/// - `{a,b}` alternatives, may nest: "*.{c,cc,h{pp,xx}}".
/// Everything else matches literally.
class GlobPattern
{
  public:
    GlobPattern() = default;

    /// @brief Compile @p pattern, expanding brace alternatives up front.
    explicit GlobPattern(std::string_view pattern);

    /// @brief Test a root-relative path against the pattern.
    [[nodiscard]] bool matches(std::string_view path) const;

    /// @brief True for a default-constructed or empty pattern, which matches nothing.
    [[nodiscard]] bool empty() const
    {
        return alternatives_.empty();
    }

    [[nodiscard]] const std::string &source() const
    {
        return source_;
    }

  private:
    std::string source_;
    std::vector<std::string> alternatives_;
};

/// @brief Expand `{a,b}` groups in @p pattern into the list of plain patterns.
/// @details Unbalanced braces are kept literally.
[[nodiscard]] std::vector<std::string> expandBraces(std::string_view pattern);

/// @brief Match a brace-free @p pattern against @p path.
[[nodiscard]] bool globMatch(std::string_view pattern, std::string_view path);

} // namespace horder::support
