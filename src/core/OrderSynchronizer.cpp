//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements order synchronization.  Block text is cut from the target text
// passed in by the caller rather than re-read, so the plan always matches the
// text the spans were checked against.
//
//===----------------------------------------------------------------------===//

#include "core/OrderSynchronizer.hpp"

#include "support/string_utils.hpp"

#include <algorithm>
#include <unordered_map>

namespace horder::core
{

std::optional<ReplacementPlan> OrderSynchronizer::plan(const std::vector<Prototype> &prototypes,
                                                       const std::vector<Implementation> &implementations,
                                                       const std::string &targetFile,
                                                       std::string_view targetText) const
{
    const std::vector<std::string> lines = support::string_utils::splitLines(targetText);

    // Bodies from this file whose spans still fit the current text.
    std::vector<const Implementation *> inFile;
    for (const auto &impl : implementations)
    {
        if (impl.sourceFile != targetFile)
            continue;
        if (impl.span.start > impl.span.end || impl.span.end >= lines.size())
            continue;
        inFile.push_back(&impl);
    }
    if (inFile.empty())
        return std::nullopt;

    std::unordered_map<std::string, const Implementation *> byName;
    for (const Implementation *impl : inFile)
        byName.emplace(impl->name, impl);

    ReplacementPlan result;
    result.file = targetFile;

    // Inserted text follows the target's own line terminator.
    const std::string_view eol = support::string_utils::lineEnding(targetText);
    const std::string separator =
        eol == "\n" ? std::string(kBlockSeparator) : std::string(eol) + std::string(eol);

    for (const auto &proto : prototypes)
    {
        auto it = byName.find(proto.name);
        if (it == byName.end())
            continue;

        const Implementation &impl = *it->second;
        if (!result.orderedNames.empty())
            result.newText.append(separator);
        result.newText.append(support::string_utils::joinLines(lines, impl.span.start, impl.span.end, eol));
        result.orderedNames.push_back(proto.name);
    }
    if (result.orderedNames.empty())
        return std::nullopt;

    LineSpan range = inFile.front()->span;
    for (const Implementation *impl : inFile)
    {
        range.start = std::min(range.start, impl->span.start);
        range.end = std::max(range.end, impl->span.end);
    }
    result.range = range;
    return result;
}

} // namespace horder::core
