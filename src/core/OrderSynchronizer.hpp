//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/OrderSynchronizer.hpp
// Purpose: Computes the edit that rewrites one file's function bodies in
//          header declaration order.
// Key invariants: The plan's range spans every matched body in the file;
//                 replacement text uses the target's line terminator.
// Ownership/Lifetime: Stateless; the returned plan is owned by the caller.
// Links: core/Model.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Model.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace horder::core
{

/// @brief Separator placed between reordered blocks of an LF file.  CRLF
///        files get "\r\n\r\n".
inline constexpr std::string_view kBlockSeparator = "\n\n";

/// @brief Builds ReplacementPlans from prototypes and located bodies.
///
/// Only one body per name per file is synchronized: the first one in
/// @p implementations order wins, so for overloads the earliest definition is
/// moved and the later ones, which still fall inside the replaced range, are
/// dropped.  A name the header declares twice gets its body emitted twice.
/// The range runs from the first to the last matched body, so any
/// code between them that is not itself a matched body is replaced too.
class OrderSynchronizer
{
  public:
    /// @brief Plan the reordering of @p targetFile.
    /// @param prototypes Header prototypes in declaration order.
    /// @param implementations Bodies from any number of files.
    /// @param targetFile File to rewrite; compared verbatim with sourceFile.
    /// @param targetText Current contents of @p targetFile.
    /// @return The plan, or std::nullopt when nothing in the file matches.
    [[nodiscard]] std::optional<ReplacementPlan> plan(const std::vector<Prototype> &prototypes,
                                                      const std::vector<Implementation> &implementations,
                                                      const std::string &targetFile,
                                                      std::string_view targetText) const;
};

} // namespace horder::core
