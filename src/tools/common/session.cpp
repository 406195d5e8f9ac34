//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the Session command layer.  Every public operation validates its
// input first and only then touches the cache or the workspace, so an error
// return never leaves partial state behind.
//
//===----------------------------------------------------------------------===//

#include "tools/common/session.hpp"

#include "core/ImplementationLocator.hpp"
#include "core/OrderSynchronizer.hpp"
#include "core/PrototypeExtractor.hpp"

#include <algorithm>
#include <cstdint>
#include <unordered_set>
#include <utility>

namespace horder::tools::common
{

Session::Session(core::Workspace &workspace,
                 core::HeaderCache &cache,
                 support::DiagnosticEngine &diags,
                 support::SourceManager &sm,
                 ProjectConfig config)
    : workspace_(workspace), cache_(cache), diags_(diags), sm_(sm), config_(std::move(config))
{
}

support::Expected<std::vector<core::Prototype>> Session::scanHeader(const std::string &headerPath)
{
    if (!isHeaderPath(headerPath, config_))
        return support::makeError({}, "'" + headerPath + "' is not recognized as a header");

    auto text = workspace_.readDocumentText(headerPath);
    if (!text)
        return support::makeError({}, text.error().message);
    return scanHeaderText(headerPath, text.value());
}

support::Expected<std::vector<core::Prototype>> Session::scanHeaderText(const std::string &headerPath,
                                                                        std::string_view text)
{
    if (!isHeaderPath(headerPath, config_))
        return support::makeError({}, "'" + headerPath + "' is not recognized as a header");

    const std::string key = workspace_.canonicalPath(headerPath);
    sm_.addFile(key);

    core::PrototypeExtractor extractor;
    std::vector<core::Prototype> prototypes = extractor.extract(text);
    cache_.put(key, prototypes);
    return prototypes;
}

std::vector<core::Implementation> Session::locateAll(const std::vector<core::Prototype> &prototypes)
{
    const std::vector<std::string> names = core::ImplementationLocator::uniqueNames(prototypes);
    if (names.empty())
        return {};

    const std::vector<std::string> files = workspace_.enumerateCandidateFiles(config_.candidates);
    core::ImplementationLocator locator(workspace_, &diags_, &sm_);
    return locator.locate(names, files);
}

support::Expected<std::vector<core::Implementation>> Session::findImplementations(
    const std::string &headerPath)
{
    auto prototypes = cache_.get(workspace_.canonicalPath(headerPath));
    if (!prototypes)
        return support::makeError({}, std::string(kNoCachedPrototypesMessage));
    return locateAll(*prototypes);
}

support::Expected<SyncResult> Session::synchronizeOrder(const std::string &headerPath,
                                                        const std::string &chosenFile)
{
    const std::string headerKey = workspace_.canonicalPath(headerPath);
    auto prototypes = cache_.get(headerKey);
    if (!prototypes || prototypes->empty())
        return support::makeError({}, std::string(kNoCachedPrototypesMessage));

    SyncResult result;
    result.implementations = locateAll(*prototypes);
    if (result.implementations.empty())
        return result;

    const std::string target = workspace_.canonicalPath(chosenFile);
    auto text = workspace_.readDocumentText(target);
    if (!text)
        return support::makeError({}, text.error().message);

    core::OrderSynchronizer synchronizer;
    result.plan = synchronizer.plan(*prototypes, result.implementations, target, text.value());

    if (verbose_)
        noteUnmatched(headerKey, *prototypes, result.plan ? &*result.plan : nullptr);
    return result;
}

support::Expected<void> Session::applyPlan(const core::ReplacementPlan &plan)
{
    return workspace_.applyReplacement(plan);
}

std::vector<std::string> Session::candidateTargets(const std::vector<core::Implementation> &implementations)
{
    std::vector<std::string> files;
    std::unordered_set<std::string> seen;
    for (const auto &impl : implementations)
    {
        if (seen.insert(impl.sourceFile).second)
            files.push_back(impl.sourceFile);
    }
    return files;
}

bool Session::invalidate(const std::string &headerPath)
{
    return cache_.invalidate(workspace_.canonicalPath(headerPath));
}

std::optional<std::vector<core::Prototype>> Session::cached(const std::string &headerPath) const
{
    return cache_.get(workspace_.canonicalPath(headerPath));
}

void Session::noteUnmatched(const std::string &headerKey,
                            const std::vector<core::Prototype> &prototypes,
                            const core::ReplacementPlan *plan)
{
    const std::uint32_t fileId = sm_.addFile(headerKey);
    std::unordered_set<std::string> noted;
    for (const auto &proto : prototypes)
    {
        const bool placed = plan && std::find(plan->orderedNames.begin(),
                                              plan->orderedNames.end(),
                                              proto.name) != plan->orderedNames.end();
        if (placed || !noted.insert(proto.name).second)
            continue;
        diags_.report(support::makeNote(support::locForLine(fileId, proto.span.start),
                                        "no implementation of '" + proto.name +
                                            "' in the chosen file"));
    }
}

} // namespace horder::tools::common
