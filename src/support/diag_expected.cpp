//===----------------------------------------------------------------------===//
//
// Part of the horder project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers.  Every horder layer
// reports failures through Expected<T>/Expected<void> carrying a Diagnostic;
// the printer here is the one place that decides how those diagnostics look on
// a terminal.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` members and diagnostic helpers.

#include "diag_expected.hpp"

namespace horder::support
{

Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Success is the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the stored diagnostic; callers must check hasValue() first.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

Diag makeWarning(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), loc};
}

Diag makeNote(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Note, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When @p sm resolves the location's file the message is prefixed
///          with "<path>:<line>:<column>: " (line and column only when known),
///          following the usual compiler style.  A trailing newline is always
///          emitted.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (sm && diag.loc.file_id != 0)
    {
        auto path = sm->getPath(diag.loc.file_id);
        if (!path.empty())
        {
            os << path;
            if (diag.loc.line != 0)
            {
                os << ':' << diag.loc.line;
                if (diag.loc.column != 0)
                {
                    os << ':' << diag.loc.column;
                }
            }
            os << ": ";
        }
    }
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace horder::support
