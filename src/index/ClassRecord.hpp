//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: index/ClassRecord.hpp
// Purpose: Members discovered for one UnrealScript class during a scan.
// Key invariants: functions/variables keep file declaration order, duplicates included.
// Ownership/Lifetime: Owned by the SymbolTable that holds it.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace ucindex::index
{

/// @brief Declared members of a single class.
struct ClassRecord
{
    std::string package;                ///< Package folder the class was found in.
    std::string name;                   ///< Class identifier; key in the SymbolTable.
    std::vector<std::string> functions; ///< Function names in declaration order.
    std::vector<std::string> variables; ///< Variable names in declaration order.

    bool operator==(const ClassRecord &) const = default;
};

} // namespace ucindex::index
