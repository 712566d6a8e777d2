//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file IndexService.hpp
/// @brief Owner of the published SymbolTable and entry point for hosts.
///
/// @details Lifecycle of the table:
///
/// ```
///  created empty ──rebuild(root)──▶ published ──snapshot()──▶ read by many
///        ▲                              │
///        └──────── replaced by the next successful rebuild ◀┘
/// ```
///
/// A rebuild scans into a private table and publishes it with one pointer
/// swap, so a reader either sees the previous table or the new one, never a
/// partially filled one.  Snapshots are `shared_ptr<const SymbolTable>`:
/// a reader holding one keeps that table alive after it has been replaced.
///
/// Rebuilds are serialized.  A rebuild requested while another is running is
/// rejected with ErrorCode::RebuildInProgress rather than queued.
///
/// After every successful publish (and on explicit invalidate()) the
/// generation counter is bumped and registered listeners are invoked, which
/// is how a host learns that open documents need to be analyzed again.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/Completion.hpp"
#include "analysis/DocumentAnalyzer.hpp"
#include "frontends/unrealscript/Keywords.hpp"
#include "frontends/unrealscript/LineClassifier.hpp"
#include "index/PackageScanner.hpp"
#include "index/SymbolTable.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ucindex::service
{

/// @brief A document handed over by the host for analysis.
struct DocumentRequest
{
    std::string_view text;
    std::string_view languageId{frontends::unrealscript::kLanguageId};
};

/// @brief Coordinates rebuilds, publication and analysis requests.
/// @details All members are safe to call from multiple threads.
class IndexService
{
  public:
    using Snapshot = std::shared_ptr<const index::SymbolTable>;
    using InvalidationListener = std::function<void(uint64_t generation)>;
    using ListenerId = size_t;

    explicit IndexService(index::ScanOptions options = {},
                          const frontends::unrealscript::LineClassifier &classifier =
                              frontends::unrealscript::defaultClassifier());

    IndexService(const IndexService &) = delete;
    IndexService &operator=(const IndexService &) = delete;

    /// @brief Scan @p rootPath and publish the result.
    /// @return Success, an IoError when the root is unreadable, or
    ///         RebuildInProgress.  On failure the published table is unchanged.
    support::Expected<void> rebuild(const std::string &rootPath);

    /// @brief Currently published table (empty before the first rebuild).
    [[nodiscard]] Snapshot snapshot() const;

    /// @brief Root of the last successful rebuild; empty before the first one.
    [[nodiscard]] std::string rootPath() const;

    /// @brief Counter bumped on every publish and invalidate().
    [[nodiscard]] uint64_t generation() const;

    /// @brief Diagnostics reported by the last rebuild attempt.
    [[nodiscard]] std::vector<support::Diagnostic> lastDiagnostics() const;

    /// @brief Counters of the last rebuild attempt.
    [[nodiscard]] index::ScanStats lastStats() const;

    /// @brief Print lastDiagnostics() with file paths resolved.
    void printLastDiagnostics(std::ostream &os) const;

    /// @brief Ask hosts to re-analyze their documents.
    /// @return The new generation passed to the listeners.
    uint64_t invalidate();

    ListenerId addInvalidationListener(InvalidationListener listener);
    void removeInvalidationListener(ListenerId id);

    /// @brief Outline and highlights of @p doc against the current snapshot.
    /// @details Documents tagged with another language yield empty results.
    [[nodiscard]] analysis::DocumentAnalysis analyze(const DocumentRequest &doc) const;

    /// @brief Same as analyze(); named for hosts reacting to invalidation.
    [[nodiscard]] analysis::DocumentAnalysis reanalyze(const DocumentRequest &doc) const
    {
        return analyze(doc);
    }

    /// @brief Completion vocabulary against the current snapshot.
    [[nodiscard]] std::vector<analysis::CompletionItem> completions() const;

  private:
    void notify(uint64_t generation);

    const index::ScanOptions options_;
    const frontends::unrealscript::LineClassifier &classifier_;

    /// Held for the whole duration of a rebuild.
    std::mutex rebuildMutex_;

    /// Guards every member below.
    mutable std::mutex stateMutex_;
    Snapshot table_;
    std::string rootPath_;
    uint64_t generation_ = 0;
    std::vector<support::Diagnostic> lastDiagnostics_;
    std::unique_ptr<support::SourceManager> lastSources_;
    index::ScanStats lastStats_;
    std::map<ListenerId, InvalidationListener> listeners_;
    ListenerId nextListenerId_ = 1;
};

} // namespace ucindex::service
