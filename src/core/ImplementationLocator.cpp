//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements implementation discovery.  Each candidate file is read once and
// scanned line by line; the declaration/definition split rests entirely on
// whether '{' or a trailing ';' comes first after the name.
//
//===----------------------------------------------------------------------===//

#include "core/ImplementationLocator.hpp"

#include "core/LineScan.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "support/string_utils.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>

namespace horder::core
{

namespace
{

/// @brief Line holding the body's opening brace, if @p matchLine starts a definition.
std::optional<std::size_t> findOpeningBrace(const std::vector<std::string> &lines, std::size_t matchLine)
{
    const std::size_t limit =
        std::min(lines.size(), matchLine + ImplementationLocator::kBraceSearchWindow);
    for (std::size_t j = matchLine; j < limit; ++j)
    {
        if (lines[j].find('{') != std::string::npos)
            return j;
        if (scan::endsWithSemicolon(lines[j]))
            return std::nullopt;
    }
    return std::nullopt;
}

std::vector<std::string> dedupe(const std::vector<std::string> &names)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto &name : names)
    {
        if (!name.empty() && seen.insert(name).second)
            out.push_back(name);
    }
    return out;
}

} // namespace

ImplementationLocator::ImplementationLocator(Workspace &workspace,
                                             support::DiagnosticEngine *diags,
                                             support::SourceManager *sm)
    : workspace_(workspace), diags_(diags), sm_(sm)
{
}

std::vector<Implementation> ImplementationLocator::locate(const std::vector<std::string> &names,
                                                          const std::vector<std::string> &files)
{
    std::vector<Implementation> found;
    if (names.empty())
        return found;

    for (const auto &file : files)
    {
        auto text = workspace_.readDocumentText(file);
        if (!text)
        {
            if (diags_)
            {
                support::SourceLoc loc{};
                if (sm_)
                    loc.file_id = sm_->addFile(file);
                diags_->report(support::makeWarning(loc, "skipped unreadable file: " + text.error().message));
            }
            continue;
        }

        auto inFile = locateInText(names, text.value(), file);
        found.insert(found.end(),
                     std::make_move_iterator(inFile.begin()),
                     std::make_move_iterator(inFile.end()));
    }
    return found;
}

std::vector<Implementation> ImplementationLocator::locateInText(const std::vector<std::string> &names,
                                                                std::string_view text,
                                                                const std::string &file)
{
    std::vector<Implementation> found;
    const std::vector<std::string> wanted = dedupe(names);
    if (wanted.empty())
        return found;

    const std::vector<std::string> lines = support::string_utils::splitLines(text);
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string &line = lines[i];
        if (scan::isCommentOnlyLine(line))
            continue;

        for (const auto &name : wanted)
        {
            if (line.find(name + "(") == std::string::npos)
                continue;

            const auto braceLine = findOpeningBrace(lines, i);
            if (!braceLine)
                continue;

            const std::size_t endLine = scan::findBlockEnd(lines, *braceLine);
            found.push_back(Implementation{name, i, LineSpan{i, endLine}, file});
        }
    }
    return found;
}

std::vector<std::string> ImplementationLocator::uniqueNames(const std::vector<Prototype> &prototypes)
{
    std::vector<std::string> names;
    names.reserve(prototypes.size());
    for (const auto &proto : prototypes)
        names.push_back(proto.name);
    return dedupe(names);
}

} // namespace horder::core
