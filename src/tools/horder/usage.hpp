//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <iosfwd>

namespace horder::tools::cli
{

/// @brief Print version information for horder.
void printVersion(std::ostream &os);

/// @brief Print usage information for horder.
void printUsage(std::ostream &os);

} // namespace horder::tools::cli
