//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Glob matching used to pick candidate implementation files, e.g. the default
// "**/*.{cpp,cc,cxx,c,hpp,ccpp}" include and "**/node_modules/**" exclude.
// Brace groups are expanded once at compile time; the matcher itself is a
// small backtracking walk, which is plenty for patterns of this size.
//
//===----------------------------------------------------------------------===//

#include "support/glob.hpp"

namespace horder::support
{

namespace
{

/// @brief Find the '}' closing the '{' at @p open, honouring nesting.
size_t findClosingBrace(std::string_view pattern, size_t open)
{
    int depth = 0;
    for (size_t i = open; i < pattern.size(); ++i)
    {
        if (pattern[i] == '{')
            ++depth;
        else if (pattern[i] == '}' && --depth == 0)
            return i;
    }
    return std::string_view::npos;
}

/// @brief Split the body of a brace group on top-level commas.
std::vector<std::string_view> splitAlternatives(std::string_view body)
{
    std::vector<std::string_view> parts;
    int depth = 0;
    size_t begin = 0;
    for (size_t i = 0; i < body.size(); ++i)
    {
        if (body[i] == '{')
            ++depth;
        else if (body[i] == '}')
            --depth;
        else if (body[i] == ',' && depth == 0)
        {
            parts.push_back(body.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    parts.push_back(body.substr(begin));
    return parts;
}

} // namespace

std::vector<std::string> expandBraces(std::string_view pattern)
{
    const size_t open = pattern.find('{');
    if (open == std::string_view::npos)
        return {std::string(pattern)};

    const size_t close = findClosingBrace(pattern, open);
    if (close == std::string_view::npos)
        return {std::string(pattern)};

    const std::string_view head = pattern.substr(0, open);
    const std::string_view body = pattern.substr(open + 1, close - open - 1);
    const std::string_view tail = pattern.substr(close + 1);

    std::vector<std::string> out;
    for (std::string_view alt : splitAlternatives(body))
    {
        std::string combined(head);
        combined.append(alt);
        combined.append(tail);
        for (auto &expanded : expandBraces(combined))
            out.push_back(std::move(expanded));
    }
    return out;
}

bool globMatch(std::string_view pattern, std::string_view path)
{
    size_t p = 0;
    size_t t = 0;
    while (p < pattern.size())
    {
        if (pattern.compare(p, 2, "**") == 0)
        {
            const bool slash = p + 2 < pattern.size() && pattern[p + 2] == '/';
            const std::string_view rest = pattern.substr(slash ? p + 3 : p + 2);
            for (size_t k = t; k <= path.size(); ++k)
            {
                // "**/" may only resume at a directory boundary.
                if (slash && k != t && path[k - 1] != '/')
                    continue;
                if (globMatch(rest, path.substr(k)))
                    return true;
            }
            return false;
        }

        const char c = pattern[p];
        if (c == '*')
        {
            const std::string_view rest = pattern.substr(p + 1);
            for (size_t k = t; k <= path.size(); ++k)
            {
                if (globMatch(rest, path.substr(k)))
                    return true;
                if (k < path.size() && path[k] == '/')
                    break;
            }
            return false;
        }

        if (t >= path.size())
            return false;
        if (c == '?')
        {
            if (path[t] == '/')
                return false;
        }
        else if (c != path[t])
        {
            return false;
        }
        ++p;
        ++t;
    }
    return t == path.size();
}

GlobPattern::GlobPattern(std::string_view pattern) : source_(pattern)
{
    if (!pattern.empty())
        alternatives_ = expandBraces(pattern);
}

bool GlobPattern::matches(std::string_view path) const
{
    for (const auto &alt : alternatives_)
    {
        if (globMatch(alt, path))
            return true;
    }
    return false;
}

} // namespace horder::support
