#ifndef CHAINER_FACT_BASE_H
#define CHAINER_FACT_BASE_H

#include <vector>
#include <unordered_set>
#include "Fact.h"

namespace Chainer
{
    class KnowledgeBase;

    // 基事实集合，保留插入顺序；推理过程中只增不减
    class FactBase
    {
    public:
        using const_iterator = std::vector<Fact>::const_iterator;

        FactBase() = default;
        explicit FactBase(const std::vector<Fact> &initial);

        // 新事实返回 true，已存在返回 false；非基事实抛出 std::invalid_argument
        bool insert(const Fact &fact);
        bool contains(const Fact &fact) const;

        const std::vector<Fact> &getFacts() const { return facts; }
        size_t size() const { return facts.size(); }
        bool empty() const { return facts.empty(); }
        const_iterator begin() const { return facts.begin(); }
        const_iterator end() const { return facts.end(); }

        void print(const KnowledgeBase &kb) const;

    private:
        std::vector<Fact> facts;
        std::unordered_set<Fact> index;
    };
}

#endif // CHAINER_FACT_BASE_H
