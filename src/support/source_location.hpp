//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the location value attached to horder diagnostics.
// Key invariants: file_id == 0 denotes "no file"; line/column are 1-based when set.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: support/source_manager.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>

namespace horder::support
{

/// @brief Position inside a header or implementation file.
/// @invariant file_id == 0 indicates an unknown location.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a registered file.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

/// @brief Build a location from a 0-based line index as used by spans.
/// @param fileId Identifier returned by SourceManager::addFile().
/// @param zeroBasedLine Line index counted from zero.
/// @return Location whose line is @p zeroBasedLine + 1.
[[nodiscard]] SourceLoc locForLine(uint32_t fileId, std::size_t zeroBasedLine);

} // namespace horder::support
