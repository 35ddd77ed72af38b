#ifndef CHAINER_PREMISE_SOLVER_H
#define CHAINER_PREMISE_SOLVER_H

#include <vector>
#include <optional>
#include "Fact.h"
#include "FactBase.h"
#include "Substitution.h"

namespace Chainer
{
    // 按需产生满足前提合取的替换。显式栈回溯，每个实例有自己的栈，互不共享状态。
    // 前提由流自己保存；facts 只持有引用，必须比流活得更久，所以不接受临时对象。
    class SubstitutionStream
    {
    public:
        SubstitutionStream(std::vector<Fact> premises, const std::vector<Fact> &facts,
                           const Substitution &initial);
        SubstitutionStream(std::vector<Fact> premises, std::vector<Fact> &&facts,
                           const Substitution &initial) = delete;

        // 下一个解；枚举完毕后一直返回 nullopt
        std::optional<Substitution> next();

        // 最近一次 next() 成功时每个前提匹配到的事实，按前提顺序
        std::vector<Fact> matchedFacts() const;

    private:
        struct Frame
        {
            Substitution sub;   // 进入这一层前提时的替换
            size_t nextFact;    // 下一个要尝试的事实下标
        };

        std::vector<Fact> premises;
        const std::vector<Fact> *facts;
        Substitution initial;
        std::vector<Frame> stack;
        std::vector<size_t> matched;
        bool exhausted = false;
    };

    class PremiseSolver
    {
    public:
        static SubstitutionStream solve(const std::vector<Fact> &premises, const FactBase &facts,
                                        const Substitution &initial = Substitution());
        static SubstitutionStream solve(const std::vector<Fact> &premises, const std::vector<Fact> &facts,
                                        const Substitution &initial = Substitution());
        static SubstitutionStream solve(const std::vector<Fact> &premises, FactBase &&facts,
                                        const Substitution &initial = Substitution()) = delete;
        static SubstitutionStream solve(const std::vector<Fact> &premises, std::vector<Fact> &&facts,
                                        const Substitution &initial = Substitution()) = delete;

        static std::vector<Substitution> solveAll(const std::vector<Fact> &premises, const FactBase &facts,
                                                  const Substitution &initial = Substitution());
    };
}

#endif // CHAINER_PREMISE_SOLVER_H
