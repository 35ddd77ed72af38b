#include "FactBase.h"
#include "KnowledgeBase.h"
#include <iostream>
#include <stdexcept>

namespace Chainer
{
    FactBase::FactBase(const std::vector<Fact> &initial)
    {
        for (const auto &fact : initial)
        {
            insert(fact);
        }
    }

    bool FactBase::insert(const Fact &fact)
    {
        if (!fact.isGround())
        {
            throw std::invalid_argument("the fact base only holds ground facts");
        }
        if (!index.insert(fact).second)
        {
            return false;
        }
        facts.push_back(fact);
        return true;
    }

    bool FactBase::contains(const Fact &fact) const
    {
        return index.find(fact) != index.end();
    }

    void FactBase::print(const KnowledgeBase &kb) const
    {
        std::cout << "Facts (" << facts.size() << "):\n";
        for (const auto &fact : facts)
        {
            std::cout << "  " << fact.toString(kb) << "\n";
        }
    }
}
