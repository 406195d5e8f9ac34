//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for SourceLoc.  Spans produced by the core are 0-based
// while diagnostics print 1-based positions; the conversion lives here so every
// caller shifts the same way.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

#include <limits>

namespace horder::support
{

/// @brief A location is valid once it names a file registered with the
///        SourceManager; line and column stay optional.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

SourceLoc locForLine(uint32_t fileId, std::size_t zeroBasedLine)
{
    SourceLoc loc{};
    loc.file_id = fileId;
    if (zeroBasedLine < std::numeric_limits<uint32_t>::max())
        loc.line = static_cast<uint32_t>(zeroBasedLine + 1);
    return loc;
}

} // namespace horder::support
