//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/string_utils.hpp
// Purpose: Small string helpers shared by the text scanners.
// Key invariants: Character classes are ASCII-only; no locale dependence.
// Ownership/Lifetime: All functions are stateless; views borrow from their input.
// Links: core/LineScan.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace horder::support::string_utils
{

[[nodiscard]] inline bool isSpace(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// @brief First character of an identifier: letter or underscore.
[[nodiscard]] inline bool isIdentStart(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

/// @brief Identifier continuation: letter, digit or underscore.
[[nodiscard]] inline bool isIdentChar(char c) noexcept
{
    return isIdentStart(c) || (c >= '0' && c <= '9');
}

/// @brief Trim leading and trailing whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view str) noexcept
{
    size_t start = 0;
    size_t end = str.size();
    while (start < end && isSpace(str[start]))
        ++start;
    while (end > start && isSpace(str[end - 1]))
        --end;
    return str.substr(start, end - start);
}

/// @brief Trim trailing whitespace only.
[[nodiscard]] inline std::string_view trimRight(std::string_view str) noexcept
{
    size_t end = str.size();
    while (end > 0 && isSpace(str[end - 1]))
        --end;
    return str.substr(0, end);
}

/// @brief Check whether @p str starts with @p word as a whole word.
/// @details The character after the word, if any, must not be an identifier
///          character, so "typedefs" does not start with the word "typedef".
[[nodiscard]] inline bool startsWithWord(std::string_view str, std::string_view word) noexcept
{
    if (str.size() < word.size() || str.substr(0, word.size()) != word)
        return false;
    return str.size() == word.size() || !isIdentChar(str[word.size()]);
}

/// @brief Split @p text into lines on "\n" or "\r\n".
/// @details A trailing newline yields a final empty line, so the number of
///          lines always equals the number of separators plus one.
[[nodiscard]] inline std::vector<std::string> splitLines(std::string_view text)
{
    std::vector<std::string> lines;
    size_t begin = 0;
    while (true)
    {
        const size_t nl = text.find('\n', begin);
        if (nl == std::string_view::npos)
        {
            lines.emplace_back(text.substr(begin));
            break;
        }
        size_t end = nl;
        if (end > begin && text[end - 1] == '\r')
            --end;
        lines.emplace_back(text.substr(begin, end - begin));
        begin = nl + 1;
    }
    return lines;
}

/// @brief Line terminator used by @p text, taken from its first newline.
/// @return "\r\n" when that newline is preceded by '\r', otherwise "\n".
[[nodiscard]] inline std::string_view lineEnding(std::string_view text) noexcept
{
    const size_t nl = text.find('\n');
    if (nl != std::string_view::npos && nl > 0 && text[nl - 1] == '\r')
        return "\r\n";
    return "\n";
}

/// @brief Join @p lines[first..last] (inclusive) with @p sep.
[[nodiscard]] inline std::string joinLines(const std::vector<std::string> &lines,
                                           size_t first,
                                           size_t last,
                                           std::string_view sep = "\n")
{
    std::string out;
    for (size_t i = first; i <= last && i < lines.size(); ++i)
    {
        if (i != first)
            out.append(sep);
        out.append(lines[i]);
    }
    return out;
}

} // namespace horder::support::string_utils
