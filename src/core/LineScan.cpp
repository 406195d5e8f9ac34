//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: core/LineScan.cpp
// Purpose: Implements the line-level predicates used by the text scanners.
// Key invariants: Results depend only on the characters of the given lines.
// Ownership/Lifetime: Stateless.
// Links: core/LineScan.hpp
//
//===----------------------------------------------------------------------===//

#include "core/LineScan.hpp"

#include "support/string_utils.hpp"

namespace horder::core::scan
{

using support::string_utils::isIdentChar;
using support::string_utils::isIdentStart;
using support::string_utils::isSpace;

namespace
{

std::string_view skipLeadingSpace(std::string_view line)
{
    size_t i = 0;
    while (i < line.size() && isSpace(line[i]))
        ++i;
    return line.substr(i);
}

} // namespace

bool isPreprocessorLine(std::string_view line)
{
    const std::string_view rest = skipLeadingSpace(line);
    return !rest.empty() && rest.front() == '#';
}

bool isCommentOnlyLine(std::string_view line)
{
    const std::string_view rest = skipLeadingSpace(line);
    return rest.size() >= 2 && rest[0] == '/' && rest[1] == '/';
}

bool endsWithSemicolon(std::string_view line)
{
    const std::string_view trimmed = support::string_utils::trimRight(line);
    return !trimmed.empty() && trimmed.back() == ';';
}

std::optional<std::string> lastCallLikeIdentifier(std::string_view text)
{
    std::optional<std::string> last;
    size_t i = 0;
    while (i < text.size())
    {
        if (!isIdentChar(text[i]))
        {
            ++i;
            continue;
        }

        size_t runEnd = i;
        while (runEnd < text.size() && isIdentChar(text[runEnd]))
            ++runEnd;

        // Leading digits cannot start an identifier; the match begins at the
        // first letter or underscore of the run.
        size_t start = i;
        while (start < runEnd && !isIdentStart(text[start]))
            ++start;

        size_t j = runEnd;
        while (j < text.size() && isSpace(text[j]))
            ++j;

        if (start < runEnd && j < text.size() && text[j] == '(')
        {
            last = std::string(text.substr(start, runEnd - start));
            i = j + 1;
            continue;
        }
        i = runEnd;
    }
    return last;
}

std::size_t findBlockEnd(const std::vector<std::string> &lines, std::size_t braceLine)
{
    long depth = 0;
    bool started = false;
    for (size_t j = braceLine; j < lines.size(); ++j)
    {
        for (char ch : lines[j])
        {
            if (ch == '{')
            {
                ++depth;
                started = true;
            }
            else if (ch == '}')
            {
                --depth;
            }
        }
        if (started && depth == 0)
            return j;
    }
    return braceLine;
}

} // namespace horder::core::scan
