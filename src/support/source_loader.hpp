//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_loader.hpp
// Purpose: Read UnrealScript source files into memory.
// Key invariants: A successful load holds the complete file contents.
// Ownership/Lifetime: The caller owns the returned buffer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <string>

namespace ucindex::support
{

/// @brief Largest source file the loader accepts.
inline constexpr std::streamoff kMaxSourceSize = static_cast<std::streamoff>(64ULL * 1024 * 1024);

/// @brief Load a source file into memory.
///
/// The file is read as raw bytes; UnrealScript sources are treated as UTF-8
/// and no transcoding happens here.
///
/// @param path Filesystem path to the source file.
/// @param loc Location attached to the diagnostic on failure (usually just a
///        file id registered with a SourceManager).
/// @return File contents on success; otherwise an IoError diagnostic of
///         severity Error.
Expected<std::string> loadSourceFile(const std::string &path, SourceLoc loc = {});

} // namespace ucindex::support
