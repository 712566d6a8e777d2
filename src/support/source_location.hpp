//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the file reference attached to diagnostics.
// Key invariants: file_id == 0 denotes a diagnostic not tied to any file.
// Ownership/Lifetime: Value type with no dynamic ownership.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace ucindex::support
{

/// @brief Attaches a diagnostic to a file registered with a SourceManager.
/// @details Scan diagnostics concern whole files, so no line or column is kept.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 when no file is involved.
    uint32_t file_id = 0;
};

} // namespace ucindex::support
