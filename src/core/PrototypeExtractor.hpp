//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/PrototypeExtractor.hpp
// Purpose: Recovers function declarations from header text with line heuristics.
// Key invariants: Output order equals declaration order; duplicates are kept.
// Ownership/Lifetime: Stateless; returned prototypes are owned by the caller.
// Links: core/Model.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Model.hpp"

#include <cstddef>
#include <string_view>
#include <vector>

namespace horder::core
{

/// @brief Splits header text into statements ending in ';' and keeps the ones
///        that look like function declarations.
///
/// Statements are accumulated line by line.  Preprocessor lines reset the
/// buffer, a leading "//" line is ignored while nothing is buffered, and a
/// buffer that grows past @ref kMaxBufferedLines lines without a ';' is
/// dropped.  A finished statement becomes a Prototype when it contains both
/// parentheses, does not begin with `typedef` or `using`, and yields a name:
/// the last identifier followed by '('.
class PrototypeExtractor
{
  public:
    /// @brief Lines a statement may span before it is abandoned.
    static constexpr std::size_t kMaxBufferedLines = 20;

    /// @brief Extract every prototype from @p text.
    /// @param text Full header contents; "\n" and "\r\n" endings are accepted.
    /// @return Prototypes in declaration order.  Never fails; text that does
    ///         not look like a declaration is skipped.
    [[nodiscard]] std::vector<Prototype> extract(std::string_view text) const;
};

} // namespace horder::core
