//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @details
 *     The package scanner reports every skipped package or file here instead of
 *     aborting, so a caller can inspect what was left out of a best-effort
 *     index once the rebuild has finished.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"
#include "source_manager.hpp"

namespace ucindex::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
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
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag`, which resolves file identifiers
 * through @p sm when one is supplied.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

/// @brief Returns the number of error-severity diagnostics recorded so far.
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

/// @brief Returns the number of warning-severity diagnostics recorded so far.
size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace ucindex::support
