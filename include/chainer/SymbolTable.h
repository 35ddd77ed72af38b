#ifndef CHAINER_SYMBOL_TABLE_H
#define CHAINER_SYMBOL_TABLE_H

#include <vector>
#include <string>
#include <optional>
#include <unordered_map>

namespace Chainer
{
    // 名字 <-> 连续整数 id 的双向映射，谓词、常量、变量各用一张
    class SymbolTable
    {
    private:
        std::vector<std::string> names;
        std::unordered_map<std::string, int> nameToId;

    public:
        int insert(const std::string &name);

        // id 越界时抛出 std::out_of_range
        const std::string &get(int id) const;

        std::optional<int> find(const std::string &name) const;

        size_t size() const { return names.size(); }
    };
}

#endif // CHAINER_SYMBOL_TABLE_H
