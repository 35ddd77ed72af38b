#include "SymbolTable.h"
#include <stdexcept>

namespace Chainer
{
    int SymbolTable::insert(const std::string &name)
    {
        auto it = nameToId.find(name);
        if (it != nameToId.end())
        {
            return it->second;
        }
        int newId = static_cast<int>(names.size());
        names.push_back(name);
        nameToId[name] = newId;
        return newId;
    }

    const std::string &SymbolTable::get(int id) const
    {
        if (id < 0 || static_cast<size_t>(id) >= names.size())
        {
            throw std::out_of_range("symbol id " + std::to_string(id) + " is not in the table");
        }
        return names[id];
    }

    std::optional<int> SymbolTable::find(const std::string &name) const
    {
        auto it = nameToId.find(name);
        if (it != nameToId.end())
        {
            return it->second;
        }
        return std::nullopt;
    }
}
