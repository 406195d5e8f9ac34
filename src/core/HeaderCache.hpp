//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/HeaderCache.hpp
// Purpose: Store of the last scanned prototypes per header.
// Key invariants: Entries are replaced wholesale by put(); nothing expires.
// Ownership/Lifetime: Owned by the application layer and injected into the
//                     code that needs it; owns copies of the prototypes.
// Links: tools/common/session.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Model.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace horder::core
{

/// @brief Maps a header identity (canonical path) to its prototypes.
class HeaderCache
{
  public:
    /// @brief Store @p prototypes under @p key, replacing any previous entry.
    void put(const std::string &key, std::vector<Prototype> prototypes);

    /// @brief Prototypes last stored under @p key.
    /// @return A copy, or std::nullopt when @p key was never scanned or was invalidated.
    [[nodiscard]] std::optional<std::vector<Prototype>> get(const std::string &key) const;

    /// @brief Drop the entry for @p key.
    /// @return True when an entry existed.
    bool invalidate(const std::string &key);

    /// @brief Drop every entry.
    void clear();

    [[nodiscard]] bool contains(const std::string &key) const;

    [[nodiscard]] std::size_t size() const
    {
        return entries_.size();
    }

  private:
    std::unordered_map<std::string, std::vector<Prototype>> entries_;
};

} // namespace horder::core
