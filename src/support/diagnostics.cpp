/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine shared by horder sessions and tools.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     A session reports warnings (unreadable candidate files) and notes
 *     (prototypes without a body in the chosen file) here while it runs; the
 *     command-line driver prints and clears the engine after each command.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"
#include "source_manager.hpp"

#include <utility>

namespace horder::support
{

/**
 * @brief Adds a diagnostic and updates the severity counters.
 *
 * Notes are stored but not counted.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to @p os using @ref printDiag.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

void DiagnosticEngine::clear()
{
    diags_.clear();
    errors_ = 0;
    warnings_ = 0;
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace horder::support
