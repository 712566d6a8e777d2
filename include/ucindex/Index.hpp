//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/ucindex/Index.hpp
// Purpose: Stable public entry point for hosts embedding the indexer.
// Key invariants: Re-exports only the host-facing types; scanner internals stay under src/.
// Ownership/Lifetime: Types mirror their definitions and retain their semantics.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/Completion.hpp"
#include "analysis/DocumentAnalyzer.hpp"
#include "analysis/SemanticTokens.hpp"
#include "frontends/unrealscript/Keywords.hpp"
#include "index/ClassRecord.hpp"
#include "index/SymbolTable.hpp"
#include "service/IndexService.hpp"
#include "support/diag_expected.hpp"
#include "ucindex/version.hpp"

/// @file include/ucindex/Index.hpp
/// @brief Aggregation header for hosts.  A typical host owns one
///        `ucindex::service::IndexService`, calls `rebuild()` when the user
///        picks a game folder, registers an invalidation listener, and calls
///        `analyze()` / `completions()` per document request.
