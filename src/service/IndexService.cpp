//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file IndexService.cpp
/// @brief Build-aside rebuilds, snapshot publication and listener dispatch.
///
//===----------------------------------------------------------------------===//

#include "service/IndexService.hpp"

#include "support/debug_log.hpp"

#include <utility>

namespace ucindex::service
{

namespace
{
constexpr std::string_view kTag = "index";
} // namespace

IndexService::IndexService(index::ScanOptions options,
                           const frontends::unrealscript::LineClassifier &classifier)
    : options_(std::move(options)), classifier_(classifier),
      table_(std::make_shared<const index::SymbolTable>()),
      lastSources_(std::make_unique<support::SourceManager>())
{
}

support::Expected<void> IndexService::rebuild(const std::string &rootPath)
{
    std::unique_lock<std::mutex> rebuildLock(rebuildMutex_, std::try_to_lock);
    if (!rebuildLock.owns_lock())
    {
        support::debugLog(kTag, "rejecting rebuild of " + rootPath + ": rebuild in progress");
        return support::Expected<void>(support::Diagnostic{support::Severity::Error,
                                                           "a rebuild is already in progress",
                                                           {},
                                                           support::ErrorCode::RebuildInProgress});
    }

    auto sources = std::make_unique<support::SourceManager>();
    support::DiagnosticEngine diags;
    index::PackageScanner scanner(diags, *sources, options_, classifier_);
    auto result = scanner.rebuildIndex(rootPath);

    auto reported = diags.diagnostics();
    if (!result)
        reported.push_back(result.error());

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        lastDiagnostics_ = std::move(reported);
        lastSources_ = std::move(sources);
        lastStats_ = scanner.stats();
        if (result)
        {
            table_ = std::make_shared<const index::SymbolTable>(std::move(result.value()));
            rootPath_ = rootPath;
            generation = ++generation_;
        }
    }

    if (!result)
        return support::Expected<void>(result.error());

    support::debugLog(kTag, "published index generation " + std::to_string(generation));
    rebuildLock.unlock();
    notify(generation);
    return support::Expected<void>{};
}

IndexService::Snapshot IndexService::snapshot() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return table_;
}

std::string IndexService::rootPath() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return rootPath_;
}

uint64_t IndexService::generation() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return generation_;
}

std::vector<support::Diagnostic> IndexService::lastDiagnostics() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastDiagnostics_;
}

index::ScanStats IndexService::lastStats() const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    return lastStats_;
}

void IndexService::printLastDiagnostics(std::ostream &os) const
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    for (const auto &diag : lastDiagnostics_)
        support::printDiag(diag, os, lastSources_.get());
}

uint64_t IndexService::invalidate()
{
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        generation = ++generation_;
    }
    notify(generation);
    return generation;
}

IndexService::ListenerId IndexService::addInvalidationListener(InvalidationListener listener)
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    const ListenerId id = nextListenerId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void IndexService::removeInvalidationListener(ListenerId id)
{
    std::lock_guard<std::mutex> lock(stateMutex_);
    listeners_.erase(id);
}

// Listeners run without the state lock so they may call back into the service.
void IndexService::notify(uint64_t generation)
{
    std::vector<InvalidationListener> pending;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        pending.reserve(listeners_.size());
        for (const auto &entry : listeners_)
            pending.push_back(entry.second);
    }
    for (const auto &listener : pending)
        listener(generation);
}

analysis::DocumentAnalysis IndexService::analyze(const DocumentRequest &doc) const
{
    if (doc.languageId != frontends::unrealscript::kLanguageId)
        return {};
    const Snapshot table = snapshot();
    return analysis::DocumentAnalyzer(classifier_).analyze(doc.text, *table);
}

std::vector<analysis::CompletionItem> IndexService::completions() const
{
    const Snapshot table = snapshot();
    return analysis::enumerateCompletions(*table);
}

} // namespace ucindex::service
