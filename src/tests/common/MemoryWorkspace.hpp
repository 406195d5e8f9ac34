//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/MemoryWorkspace.hpp
// Purpose: In-memory Workspace used by core and session tests.
// Key invariants: Enumeration follows insertion order; every read and apply
//                 is recorded so tests can assert on I/O.
// Ownership/Lifetime: Owns copies of all document text.
// Links: core/Workspace.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "core/Workspace.hpp"
#include "support/glob.hpp"
#include "support/path_utils.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace horder::tests
{

class MemoryWorkspace final : public core::Workspace
{
  public:
    /// @brief Add or replace a document.
    void setFile(const std::string &path, std::string text)
    {
        const std::string key = canonicalPath(path);
        if (files_.find(key) == files_.end())
            order_.push_back(key);
        files_[key] = std::move(text);
    }

    /// @brief Make reads of @p path fail while it still enumerates.
    void makeUnreadable(const std::string &path)
    {
        const std::string key = canonicalPath(path);
        if (files_.find(key) == files_.end())
            order_.push_back(key);
        unreadable_.insert(key);
    }

    /// @brief Make applyReplacement fail.
    void failApplies(bool fail)
    {
        failApplies_ = fail;
    }

    support::Expected<std::string> readDocumentText(const std::string &path) override
    {
        const std::string key = canonicalPath(path);
        reads.push_back(key);
        if (unreadable_.count(key) != 0)
            return support::makeError({}, "unable to open " + key);
        auto it = files_.find(key);
        if (it == files_.end())
            return support::makeError({}, "unable to open " + key);
        return it->second;
    }

    std::vector<std::string> enumerateCandidateFiles(const core::CandidateQuery &query) override
    {
        ++enumerations;
        const support::GlobPattern include(query.include);
        const support::GlobPattern exclude(query.exclude);
        std::vector<std::string> out;
        for (const auto &path : order_)
        {
            if (out.size() >= query.limit)
                break;
            if (!include.matches(path) || (!exclude.empty() && exclude.matches(path)))
                continue;
            out.push_back(path);
        }
        return out;
    }

    support::Expected<void> applyReplacement(const core::ReplacementPlan &plan) override
    {
        if (failApplies_)
            return support::Expected<void>(support::makeError({}, "document is read-only"));
        applied.push_back(plan);
        return {};
    }

    std::string canonicalPath(std::string_view path) const override
    {
        return support::normalizePath(path);
    }

    const std::string &text(const std::string &path) const
    {
        return files_.at(canonicalPath(path));
    }

    std::vector<std::string> reads;
    std::vector<core::ReplacementPlan> applied;
    int enumerations = 0;

  private:
    std::map<std::string, std::string> files_;
    std::vector<std::string> order_;
    std::set<std::string> unreadable_;
    bool failApplies_ = false;
};

} // namespace horder::tests
