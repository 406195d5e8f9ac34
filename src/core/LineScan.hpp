//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/LineScan.hpp
// Purpose: Line-level predicates and scans shared by the extractor and the
//          locator.
// Key invariants: Every helper is a pure function of its input text; none of
//                 them understands string literals or block comments.
// Ownership/Lifetime: Stateless; returned strings are owned by the caller.
// Links: core/PrototypeExtractor.cpp, core/ImplementationLocator.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace horder::core::scan
{

/// @brief True when the first non-blank character of @p line is '#'.
[[nodiscard]] bool isPreprocessorLine(std::string_view line);

/// @brief True when the first non-blank characters of @p line are "//".
[[nodiscard]] bool isCommentOnlyLine(std::string_view line);

/// @brief True when @p line ends with ';' once trailing whitespace is removed.
[[nodiscard]] bool endsWithSemicolon(std::string_view line);

/// @brief Last identifier in @p text that is followed by optional whitespace
///        and '('.
/// @details Identifiers are maximal runs of `[A-Za-z0-9_]` starting at their
///          first letter or underscore, so "2fast(" yields "fast".  Whitespace
///          between the identifier and '(' may include newlines.
/// @return The identifier, or std::nullopt when there is no call-like token.
[[nodiscard]] std::optional<std::string> lastCallLikeIdentifier(std::string_view text);

/// @brief Flat brace-depth scan starting at @p braceLine.
/// @details Counts every '{' and '}' character by character, including those
///          inside literals and comments.  The result is the first line where
///          depth returns to zero after having been positive.  When the
///          braces never balance, @p braceLine is returned.
[[nodiscard]] std::size_t findBlockEnd(const std::vector<std::string> &lines, std::size_t braceLine);

} // namespace horder::core::scan
