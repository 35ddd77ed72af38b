#include "PremiseSolver.h"
#include "Unifier.h"
#include <utility>

namespace Chainer
{
    SubstitutionStream::SubstitutionStream(std::vector<Fact> premises, const std::vector<Fact> &facts,
                                           const Substitution &initial)
        : premises(std::move(premises)), facts(&facts), initial(initial), matched(this->premises.size(), 0)
    {
        stack.push_back({initial, 0});
    }

    std::optional<Substitution> SubstitutionStream::next()
    {
        if (exhausted)
        {
            return std::nullopt;
        }

        // 没有前提：恰好产生一次初始替换
        if (premises.empty())
        {
            exhausted = true;
            return initial;
        }

        while (!stack.empty())
        {
            size_t depth = stack.size() - 1;
            Frame &top = stack.back();
            if (top.nextFact >= facts->size())
            {
                // 这一层的事实都试过了，回溯
                stack.pop_back();
                continue;
            }

            size_t factIndex = top.nextFact++;
            auto extended = Unifier::unify(premises[depth], (*facts)[factIndex], top.sub);
            if (!extended)
            {
                continue;
            }

            matched[depth] = factIndex;
            if (depth + 1 == premises.size())
            {
                // 栈保持不动，下次调用从同一层的下一个事实继续
                return extended;
            }
            stack.push_back({std::move(*extended), 0});
        }

        exhausted = true;
        return std::nullopt;
    }

    std::vector<Fact> SubstitutionStream::matchedFacts() const
    {
        std::vector<Fact> result;
        result.reserve(matched.size());
        for (size_t index : matched)
        {
            result.push_back((*facts)[index]);
        }
        return result;
    }

    SubstitutionStream PremiseSolver::solve(const std::vector<Fact> &premises, const FactBase &facts,
                                            const Substitution &initial)
    {
        return SubstitutionStream(premises, facts.getFacts(), initial);
    }

    SubstitutionStream PremiseSolver::solve(const std::vector<Fact> &premises, const std::vector<Fact> &facts,
                                            const Substitution &initial)
    {
        return SubstitutionStream(premises, facts, initial);
    }

    std::vector<Substitution> PremiseSolver::solveAll(const std::vector<Fact> &premises, const FactBase &facts,
                                                      const Substitution &initial)
    {
        std::vector<Substitution> result;
        SubstitutionStream stream = solve(premises, facts, initial);
        while (auto sub = stream.next())
        {
            result.push_back(std::move(*sub));
        }
        return result;
    }
}
