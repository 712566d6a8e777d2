//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: index/SymbolTable.hpp
// Purpose: Index from class name to its declared functions and variables.
// Key invariants: At most one record per class name; a later insertion under an
//                 existing name replaces the earlier record wholesale.
// Ownership/Lifetime: Owns its records. Published tables are immutable and
//                     shared through IndexService snapshots.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "index/ClassRecord.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace ucindex::index
{

/// @brief Class name to ClassRecord mapping produced by a package scan.
/// @details Iteration is in ascending class-name order so every consumer
///          (completion lists, highlight passes, CLI listings) sees a stable
///          order for the same tree.
class SymbolTable
{
  public:
    using Map = std::map<std::string, ClassRecord, std::less<>>;
    using const_iterator = Map::const_iterator;

    /// @brief Insert @p record, replacing any record with the same name.
    /// @return Reference to the stored record; stays valid until the record
    ///         is replaced or the table is destroyed.
    ClassRecord &insertOrReplace(ClassRecord record);

    /// @brief Look up a class by exact (case-sensitive) name.
    /// @return Pointer to the record or nullptr when unknown.
    [[nodiscard]] const ClassRecord *find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const
    {
        return find(name) != nullptr;
    }

    [[nodiscard]] size_t size() const noexcept
    {
        return classes_.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return classes_.empty();
    }

    /// @brief All class names in ascending order.
    [[nodiscard]] std::vector<std::string> classNames() const;

    const_iterator begin() const
    {
        return classes_.begin();
    }

    const_iterator end() const
    {
        return classes_.end();
    }

    /// @brief Same keys and, per key, same package and member lists.
    bool operator==(const SymbolTable &) const = default;

  private:
    Map classes_;
};

} // namespace ucindex::index
