//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements prototype extraction.  The scanner never looks inside a statement
// beyond three questions: does it end in ';', does it carry parentheses, and
// which identifier is the last one followed by '('.  That last-match rule is
// what lets "const char *name(int a)" and "int (*make(void))(int)" resolve to
// the declarator rather than a type or specifier.
//
//===----------------------------------------------------------------------===//

#include "core/PrototypeExtractor.hpp"

#include "core/LineScan.hpp"
#include "support/string_utils.hpp"

#include <string>

namespace horder::core
{

namespace
{

/// @brief Filter applied to a completed statement before naming it.
bool looksLikeFunctionDeclaration(std::string_view statement)
{
    using support::string_utils::startsWithWord;

    if (statement.find('(') == std::string_view::npos ||
        statement.find(')') == std::string_view::npos)
        return false;
    // Function-pointer typedefs and aliases end in ';' and carry parentheses
    // but declare no function.
    return !startsWithWord(statement, "typedef") && !startsWithWord(statement, "using");
}

} // namespace

std::vector<Prototype> PrototypeExtractor::extract(std::string_view text) const
{
    const std::vector<std::string> lines = support::string_utils::splitLines(text);

    std::vector<Prototype> prototypes;
    std::vector<std::string> buffer;
    std::size_t bufferStart = 0;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string &line = lines[i];

        if (scan::isPreprocessorLine(line))
        {
            buffer.clear();
            continue;
        }

        if (buffer.empty() && scan::isCommentOnlyLine(line))
            continue;

        buffer.push_back(line);
        if (buffer.size() == 1)
            bufferStart = i;

        if (scan::endsWithSemicolon(line))
        {
            const std::string joined = support::string_utils::joinLines(buffer, 0, buffer.size() - 1);
            const std::string statement(support::string_utils::trim(joined));

            if (looksLikeFunctionDeclaration(statement))
            {
                if (auto name = scan::lastCallLikeIdentifier(statement))
                {
                    prototypes.push_back(Prototype{std::move(*name), statement, LineSpan{bufferStart, i}});
                }
            }
            buffer.clear();
        }

        if (buffer.size() > kMaxBufferedLines)
            buffer.clear();
    }

    return prototypes;
}

} // namespace horder::core
