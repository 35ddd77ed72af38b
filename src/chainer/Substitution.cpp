#include "Substitution.h"
#include "KnowledgeBase.h"
#include <iostream>
#include <stdexcept>

namespace Chainer
{
    Term Substitution::resolve(const Term &term) const
    {
        Term current = term;
        while (current.isVariable())
        {
            auto bound = lookup(current);
            if (!bound)
            {
                break;
            }
            current = *bound;
        }
        return current;
    }

    Substitution Substitution::extend(const Term &variable, const Term &term) const
    {
        if (!variable.isVariable())
        {
            throw std::logic_error("cannot bind constant " + std::to_string(variable.id));
        }
        if (isBound(variable))
        {
            throw std::logic_error("variable " + std::to_string(variable.id) + " is already bound");
        }
        if (resolve(term) == variable)
        {
            throw std::logic_error("binding variable " + std::to_string(variable.id) + " would create a cycle");
        }

        Substitution extended(*this);
        extended.bindings.emplace_back(variable, term);
        return extended;
    }

    Fact Substitution::apply(const Fact &fact) const
    {
        std::vector<Term> newArgs;
        newArgs.reserve(fact.arity());
        for (const Term &arg : fact.getArguments())
        {
            newArgs.push_back(resolve(arg));
        }
        return Fact(fact.getPredicateId(), newArgs);
    }

    std::optional<Term> Substitution::lookup(const Term &variable) const
    {
        for (const auto &[var, term] : bindings)
        {
            if (var == variable)
            {
                return term;
            }
        }
        return std::nullopt;
    }

    bool Substitution::isBound(const Term &variable) const
    {
        return lookup(variable).has_value();
    }

    bool Substitution::operator==(const Substitution &other) const
    {
        if (bindings.size() != other.bindings.size())
        {
            return false;
        }
        for (const auto &[var, term] : bindings)
        {
            auto otherTerm = other.lookup(var);
            if (!otherTerm || *otherTerm != term)
            {
                return false;
            }
        }
        return true;
    }

    std::string Substitution::toString(const KnowledgeBase &kb) const
    {
        std::string result = "{";
        for (size_t i = 0; i < bindings.size(); ++i)
        {
            result += kb.getSymbolName(bindings[i].first) + " -> " + kb.getSymbolName(bindings[i].second);
            if (i < bindings.size() - 1)
            {
                result += ", ";
            }
        }
        result += "}";
        return result;
    }

    void Substitution::print(const KnowledgeBase &kb) const
    {
        if (bindings.empty())
        {
            std::cout << "Empty substitution (identity mapping)" << std::endl;
            return;
        }

        std::cout << "Substitution:" << std::endl;
        for (const auto &[var, term] : bindings)
        {
            std::cout << kb.getSymbolName(var) << " -> " << kb.getSymbolName(term) << std::endl;
        }
    }
}
