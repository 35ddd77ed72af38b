#ifndef CHAINER_FACT_H
#define CHAINER_FACT_H

#include <vector>
#include <string>
#include "Term.h"

namespace Chainer
{
    class KnowledgeBase;

    // 谓词 + 有序参数列表。规则中的前提/结论模板也用 Fact 表示，可以含变量
    class Fact
    {
    public:
        Fact(int predId, const std::vector<Term> &args);

        int getPredicateId() const;
        const std::vector<Term> &getArguments() const;
        size_t arity() const { return arguments.size(); }

        // 不含任何变量
        bool isGround() const;

        bool operator==(const Fact &other) const;
        bool operator!=(const Fact &other) const;

        size_t hash() const
        {
            size_t h = std::hash<int>{}(predicateId);
            for (const auto &arg : arguments)
            {
                h ^= std::hash<Term>{}(arg) + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }

        // 零参数时输出 Name，否则 Name(a, b)
        std::string toString(const KnowledgeBase &kb) const;

    private:
        int predicateId;
        std::vector<Term> arguments;
    };
}

namespace std
{
    template <>
    struct hash<Chainer::Fact>
    {
        size_t operator()(const Chainer::Fact &fact) const
        {
            return fact.hash();
        }
    };
}

#endif // CHAINER_FACT_H
