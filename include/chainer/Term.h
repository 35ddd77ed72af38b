// Term.h
#ifndef CHAINER_TERM_H
#define CHAINER_TERM_H
#include <functional>
namespace Chainer
{
    enum class TermType
    {
        CONSTANT,
        VARIABLE
    };

    // 项：类型标签 + 符号表下标，类型在解析时确定，之后不再从文本推断
    struct Term
    {
        TermType type;
        int id;

        bool isVariable() const { return type == TermType::VARIABLE; }
        bool isConstant() const { return type == TermType::CONSTANT; }

        bool operator==(const Term &other) const
        {
            return type == other.type && id == other.id;
        }

        bool operator!=(const Term &other) const
        {
            return !(*this == other);
        }

        bool operator<(const Term &other) const
        {
            if (type != other.type)
            {
                return type < other.type;
            }
            return id < other.id;
        }
    };
}

namespace std
{
    template <>
    struct hash<Chainer::Term>
    {
        std::size_t operator()(const Chainer::Term &term) const
        {
            std::size_t h1 = std::hash<int>{}(static_cast<int>(term.type));
            std::size_t h2 = std::hash<int>{}(term.id);
            return h1 ^ (h2 << 1);
        }
    };
}

#endif // CHAINER_TERM_H
