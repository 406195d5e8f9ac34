//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Reads header and implementation files into memory for the workspace.
// Key invariants: A successful load holds the complete file contents.
// Ownership/Lifetime: The caller owns the returned buffer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <cstdint>
#include <string>

namespace horder::tools::common
{

/// @brief Largest file the loader accepts.
inline constexpr std::uint64_t kMaxSourceSize = 256ULL * 1024 * 1024;

/// @brief Load a text file into memory.
///
/// Opens @p path in binary mode so line endings reach the scanners untouched.
///
/// @return File contents on success; otherwise a diagnostic describing the
///         open failure, oversize file or allocation failure.
support::Expected<std::string> loadSourceFile(const std::string &path);

} // namespace horder::tools::common
