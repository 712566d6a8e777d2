//===----------------------------------------------------------------------===//
//
// Part of the UCIndex project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "index/SymbolTable.hpp"

#include <utility>

namespace ucindex::index
{

ClassRecord &SymbolTable::insertOrReplace(ClassRecord record)
{
    std::string key = record.name;
    return classes_.insert_or_assign(std::move(key), std::move(record)).first->second;
}

const ClassRecord *SymbolTable::find(std::string_view name) const
{
    auto it = classes_.find(name);
    return it == classes_.end() ? nullptr : &it->second;
}

std::vector<std::string> SymbolTable::classNames() const
{
    std::vector<std::string> names;
    names.reserve(classes_.size());
    for (const auto &entry : classes_)
        names.push_back(entry.first);
    return names;
}

} // namespace ucindex::index
