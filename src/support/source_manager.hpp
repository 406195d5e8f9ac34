//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps the files a session touches to small identifiers for diagnostics.
// Key invariants: File ID 0 is invalid; a path registered twice keeps its first id.
// Ownership/Lifetime: Manager owns the normalized path strings.
// Links: support/source_location.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace horder::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric file identifiers and the header and
/// implementation paths they stand for.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path; normalized before storage.
    /// @return File identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @return Stored path or an empty view for unknown identifiers.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Look up the id of an already registered path without adding it.
    /// @return Identifier or 0 when @p path was never registered.
    uint32_t findFile(std::string_view path) const;

    /// @brief Number of registered files.
    [[nodiscard]] std::size_t size() const
    {
        return files_.size();
    }

  private:
    /// Index corresponds to file identifier - 1; deque keeps views stable.
    std::deque<std::string> files_;

    /// Next identifier to assign; 64-bit so overflow is detectable.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace horder::support
