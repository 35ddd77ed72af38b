#ifndef CHAINER_SUBSTITUTION_H
#define CHAINER_SUBSTITUTION_H

#include <vector>
#include <string>
#include <optional>
#include <utility>
#include "Term.h"
#include "Fact.h"

namespace Chainer
{
    class KnowledgeBase;

    // 变量 -> 项 的不可变映射。extend 返回新值，旧值不变，回溯时直接丢弃即可
    class Substitution
    {
    public:
        using Binding = std::pair<Term, Term>;
        using const_iterator = std::vector<Binding>::const_iterator;

        Substitution() = default;

        // 沿绑定链追到常量或未绑定的变量
        Term resolve(const Term &term) const;

        // 绑定一个未绑定的变量；对已绑定变量、常量键或会成环的绑定抛出 std::logic_error
        Substitution extend(const Term &variable, const Term &term) const;

        Fact apply(const Fact &fact) const;

        std::optional<Term> lookup(const Term &variable) const;
        bool isBound(const Term &variable) const;

        size_t size() const { return bindings.size(); }
        bool empty() const { return bindings.empty(); }
        const_iterator begin() const { return bindings.begin(); }
        const_iterator end() const { return bindings.end(); }

        // 与绑定顺序无关
        bool operator==(const Substitution &other) const;
        bool operator!=(const Substitution &other) const { return !(*this == other); }

        std::string toString(const KnowledgeBase &kb) const;
        void print(const KnowledgeBase &kb) const;

    private:
        std::vector<Binding> bindings; // 按绑定顺序，保证输出可复现
    };
}

#endif // CHAINER_SUBSTITUTION_H
