#include "KnowledgeBase.h"
#include "Errors.h"
#include <iostream>
#include <stdexcept>

namespace Chainer
{
    KnowledgeBase::KnowledgeBase(bool strictArity) : strictArity(strictArity) {}

    int KnowledgeBase::addPredicate(const std::string &predicate)
    {
        return predicateTable.insert(predicate);
    }

    Term KnowledgeBase::addVariable(const std::string &variable)
    {
        return {TermType::VARIABLE, variableTable.insert(variable)};
    }

    Term KnowledgeBase::addConstant(const std::string &constant)
    {
        return {TermType::CONSTANT, constantTable.insert(constant)};
    }

    void KnowledgeBase::validateArity(int predicateId, size_t arity) const
    {
        auto it = predicateArity.find(predicateId);
        if (strictArity && it != predicateArity.end() && it->second != arity)
        {
            throw ArityMismatchError(getPredicateName(predicateId), it->second, arity);
        }
    }

    void KnowledgeBase::checkArity(int predicateId, size_t arity)
    {
        validateArity(predicateId, arity);
        predicateArity.emplace(predicateId, arity);
    }

    void KnowledgeBase::addFact(const Fact &fact)
    {
        if (!fact.isGround())
        {
            throw std::invalid_argument("fact " + fact.toString(*this) + " contains a variable");
        }
        checkArity(fact.getPredicateId(), fact.arity());
        if (factIndex.insert(fact).second)
        {
            facts.push_back(fact);
        }
    }

    void KnowledgeBase::addRule(const Rule &rule)
    {
        // 先检查整条规则，全部通过后才登记参数个数
        std::vector<const Fact *> atoms;
        for (const auto &premise : rule.getPremises())
        {
            atoms.push_back(&premise);
        }
        atoms.push_back(&rule.getConclusion());

        std::unordered_map<int, size_t> pending;
        for (const Fact *atom : atoms)
        {
            validateArity(atom->getPredicateId(), atom->arity());
            auto [it, inserted] = pending.emplace(atom->getPredicateId(), atom->arity());
            if (!inserted && strictArity && it->second != atom->arity())
            {
                throw ArityMismatchError(getPredicateName(atom->getPredicateId()), it->second, atom->arity());
            }
        }

        predicateArity.insert(pending.begin(), pending.end());
        rules.push_back(rule);
    }

    const std::vector<Fact> &KnowledgeBase::getFacts() const
    {
        return facts;
    }

    const std::vector<Rule> &KnowledgeBase::getRules() const
    {
        return rules;
    }

    const std::string &KnowledgeBase::getPredicateName(int id) const
    {
        return predicateTable.get(id);
    }

    const std::string &KnowledgeBase::getSymbolName(const Term &term) const
    {
        if (term.isVariable())
        {
            return variableTable.get(term.id);
        }
        return constantTable.get(term.id);
    }

    std::optional<int> KnowledgeBase::getPredicateId(const std::string &predicateName) const
    {
        return predicateTable.find(predicateName);
    }

    std::optional<Term> KnowledgeBase::getSymbolId(const std::string &symbolName) const
    {
        // 先查变量表，再查常量表
        if (auto varId = variableTable.find(symbolName))
        {
            return Term{TermType::VARIABLE, *varId};
        }
        if (auto constId = constantTable.find(symbolName))
        {
            return Term{TermType::CONSTANT, *constId};
        }
        return std::nullopt;
    }

    bool KnowledgeBase::hasFact(const Fact &fact) const
    {
        return factIndex.find(fact) != factIndex.end();
    }

    void KnowledgeBase::print() const
    {
        std::cout << "Knowledge Base:\n";
        std::cout << "Rules:\n";
        for (size_t i = 0; i < rules.size(); ++i)
        {
            std::cout << "  [" << i << "] " << rules[i].toString(*this) << "\n";
        }
        std::cout << "Facts:\n";
        for (const auto &fact : facts)
        {
            std::cout << "  " << fact.toString(*this) << "\n";
        }
    }
}
