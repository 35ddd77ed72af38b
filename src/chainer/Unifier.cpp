#include "Unifier.h"
#include <stdexcept>

namespace Chainer
{
    std::optional<Substitution> Unifier::unify(const Fact &pattern, const Fact &fact, const Substitution &sub)
    {
        if (!fact.isGround())
        {
            throw std::invalid_argument("unify expects a ground fact as its second argument");
        }

        // 检查谓词和参数个数是否相同
        if (pattern.getPredicateId() != fact.getPredicateId() || pattern.arity() != fact.arity())
            return std::nullopt;

        return unifyArguments(pattern.getArguments(), fact.getArguments(), sub);
    }

    std::optional<Substitution> Unifier::unifyArguments(const std::vector<Term> &patternArgs,
                                                        const std::vector<Term> &factArgs,
                                                        const Substitution &sub)
    {
        Substitution current = sub;
        for (size_t i = 0; i < patternArgs.size(); ++i)
        {
            Term resolved = current.resolve(patternArgs[i]);

            if (resolved.isVariable())
            {
                // 未绑定的变量直接绑定到事实中的常量
                current = current.extend(resolved, factArgs[i]);
            }
            else if (resolved != factArgs[i])
            {
                return std::nullopt;
            }
        }
        return current;
    }
}
