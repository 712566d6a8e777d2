//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager used by the package scanner.  Every `.uc` file
// the scanner opens is registered here so that warnings about unreadable files
// can carry a compact file id instead of a copied path string.
//
//===----------------------------------------------------------------------===//

#include "source_manager.hpp"

#include <filesystem>
#include <limits>

namespace ucindex::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details Paths are normalized to generic (forward slash) form so the same
///          file reached through `Core/Classes/../Classes/Actor.uc` and
///          `Core/Classes/Actor.uc` shares one identifier.
///
/// @param path Filesystem path to normalize and store.
/// @return Identifier (>0) representing the stored path, or 0 on overflow.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (files_.size() >= std::numeric_limits<uint32_t>::max())
        return 0;

    files_.push_back(std::move(normalized));
    const auto file_id = static_cast<uint32_t>(files_.size());
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Retrieve the normalized path associated with a file identifier.
/// @return Stored path, or an empty view when @p file_id is unknown.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}
} // namespace ucindex::support
