//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/Model.hpp
// Purpose: Value types exchanged between the prototype extractor, the
//          implementation locator and the order synchronizer.
// Key invariants: Lines are 0-based; LineSpan::end is inclusive.
// Ownership/Lifetime: Plain values; every string is owned by its struct.
// Links: core/PrototypeExtractor.hpp, core/ImplementationLocator.hpp,
//        core/OrderSynchronizer.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace horder::core
{

/// @brief Inclusive range of 0-based line numbers.
struct LineSpan
{
    std::size_t start = 0;
    std::size_t end = 0;

    [[nodiscard]] std::size_t lineCount() const
    {
        return end >= start ? end - start + 1 : 0;
    }

    bool operator==(const LineSpan &other) const = default;
};

/// @brief Function declaration found in a header.
struct Prototype
{
    /// @brief Declared function name.
    /// @invariant Non-empty identifier `[A-Za-z_][A-Za-z0-9_]*`.
    std::string name;

    /// @brief Raw declaration text, buffered lines joined by '\n' and trimmed.
    std::string signature;

    /// @brief Header lines from the first buffered line to the one holding ';'.
    LineSpan span;
};

/// @brief Function body found in a candidate source file.
struct Implementation
{
    std::string name;

    /// @brief Line on which `name(` was found.
    std::size_t definitionLine = 0;

    /// @brief From definitionLine to the line closing the body's outer brace.
    LineSpan span;

    /// @brief File the body was read from, as reported by the Workspace.
    std::string sourceFile;
};

/// @brief Text replacement that puts one file's bodies into header order.
struct ReplacementPlan
{
    std::string file;

    /// @brief Lines to replace, covering every matched body in @ref file.
    LineSpan range;

    /// @brief Reordered blocks joined by a blank line, in the file's line ending.
    std::string newText;

    /// @brief Names of the blocks in @ref newText, in emitted order.
    std::vector<std::string> orderedNames;
};

} // namespace horder::core
