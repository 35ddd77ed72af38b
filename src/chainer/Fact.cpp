#include "Fact.h"
#include "KnowledgeBase.h"
#include <algorithm>

namespace Chainer
{
    Fact::Fact(int predId, const std::vector<Term> &args)
        : predicateId(predId), arguments(args) {}

    int Fact::getPredicateId() const
    {
        return predicateId;
    }

    const std::vector<Term> &Fact::getArguments() const
    {
        return arguments;
    }

    bool Fact::isGround() const
    {
        return std::none_of(arguments.begin(), arguments.end(),
                            [](const Term &term)
                            { return term.isVariable(); });
    }

    bool Fact::operator==(const Fact &other) const
    {
        return predicateId == other.predicateId &&
               arguments == other.arguments;
    }

    bool Fact::operator!=(const Fact &other) const
    {
        return !(*this == other);
    }

    std::string Fact::toString(const KnowledgeBase &kb) const
    {
        std::string result = kb.getPredicateName(predicateId);
        if (arguments.empty())
        {
            return result;
        }
        result += "(";
        for (size_t i = 0; i < arguments.size(); ++i)
        {
            result += kb.getSymbolName(arguments[i]);
            if (i < arguments.size() - 1)
            {
                result += ", ";
            }
        }
        result += ")";
        return result;
    }
}
