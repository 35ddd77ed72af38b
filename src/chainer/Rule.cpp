#include "Rule.h"
#include "KnowledgeBase.h"
#include "Errors.h"
#include <unordered_set>

namespace Chainer
{
    Rule::Rule(const std::vector<Fact> &premises, const Fact &conclusion, const KnowledgeBase &kb)
        : premises(premises), conclusion(conclusion)
    {
        std::unordered_set<Term> bound;
        for (const auto &premise : premises)
        {
            for (const auto &arg : premise.getArguments())
            {
                if (arg.isVariable())
                {
                    bound.insert(arg);
                }
            }
        }

        for (const auto &arg : conclusion.getArguments())
        {
            if (arg.isVariable() && bound.find(arg) == bound.end())
            {
                throw UnsafeRuleError("variable " + kb.getSymbolName(arg) +
                                      " in conclusion of rule " + toString(kb) +
                                      " does not occur in any premise");
            }
        }
    }

    const std::vector<Fact> &Rule::getPremises() const
    {
        return premises;
    }

    const Fact &Rule::getConclusion() const
    {
        return conclusion;
    }

    std::string Rule::toString(const KnowledgeBase &kb) const
    {
        std::string result;
        for (size_t i = 0; i < premises.size(); ++i)
        {
            result += premises[i].toString(kb);
            if (i < premises.size() - 1)
            {
                result += " & ";
            }
        }
        if (!premises.empty())
        {
            result += " ";
        }
        result += "=> " + conclusion.toString(kb);
        return result;
    }
}
