//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Assigns numeric identifiers to scanned source files for diagnostics.
// Key invariants: File ID 0 is invalid; a path always maps to the same id.
// Ownership/Lifetime: Manager owns file path strings.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace ucindex::support
{

/// Maintains the mapping between numeric file identifiers and the normalized
/// filesystem paths of the `.uc` files visited by a scan.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @param path File system path.
    /// @return File identifier (>0 on success, 0 when the id space is exhausted).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id.
    /// @param file_id Identifier returned by addFile().
    /// @return File path string view, empty for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of distinct files registered so far.
    size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Index corresponds to file identifier minus one. A deque keeps string
    /// references stable while the manager grows.
    std::deque<std::string> files_;

    /// Lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace ucindex::support
