#ifndef CHAINER_UNIFIER_H
#define CHAINER_UNIFIER_H

#include <optional>
#include "Fact.h"
#include "Substitution.h"

namespace Chainer
{
    class Unifier
    {
    public:
        // 单向合一：pattern 是规则前提模板，fact 必须是基事实（否则抛出 std::invalid_argument）
        // 成功时返回扩展后的替换，失败返回 nullopt
        static std::optional<Substitution> unify(const Fact &pattern, const Fact &fact, const Substitution &sub);

    private:
        static std::optional<Substitution> unifyArguments(const std::vector<Term> &patternArgs,
                                                          const std::vector<Term> &factArgs,
                                                          const Substitution &sub);
    };
}

#endif // CHAINER_UNIFIER_H
