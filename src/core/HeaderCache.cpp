//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/HeaderCache.cpp
// Purpose: Implements the per-header prototype store.
// Key invariants: get() after put() returns exactly the stored sequence.
// Ownership/Lifetime: Entries live until invalidated, cleared or replaced.
// Links: core/HeaderCache.hpp
//
//===----------------------------------------------------------------------===//

#include "core/HeaderCache.hpp"

#include <utility>

namespace horder::core
{

void HeaderCache::put(const std::string &key, std::vector<Prototype> prototypes)
{
    entries_.insert_or_assign(key, std::move(prototypes));
}

std::optional<std::vector<Prototype>> HeaderCache::get(const std::string &key) const
{
    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

bool HeaderCache::invalidate(const std::string &key)
{
    return entries_.erase(key) != 0;
}

void HeaderCache::clear()
{
    entries_.clear();
}

bool HeaderCache::contains(const std::string &key) const
{
    return entries_.find(key) != entries_.end();
}

} // namespace horder::core
