#ifndef CHAINER_CHAIN_RESULT_H
#define CHAINER_CHAIN_RESULT_H

#include <string>
#include <vector>
#include "Fact.h"
#include "FactBase.h"
#include "Substitution.h"

namespace Chainer
{
    class KnowledgeBase;

    enum class ChainState
    {
        RUNNING,
        CONVERGED,          // 一轮没有产生新事实
        QUERY_PROVEN,       // 查询事实已在事实库中
        ROUND_CAP_EXCEEDED, // 达到轮数上限仍未收敛
        CANCELLED           // 两轮之间收到停止请求
    };

    std::string chainStateToString(ChainState state);

    // 一次推理：第 round 轮用第 ruleIndex 条规则，在 substitution 下由 sourceFacts 得到 derived
    struct InferenceStep
    {
        int round;
        size_t ruleIndex;
        Substitution substitution;
        std::vector<Fact> sourceFacts;
        Fact derived;
    };

    struct ChainResult
    {
        bool proven = false;
        ChainState state = ChainState::RUNNING;
        int rounds = 0; // 产生了新事实的轮数
        std::vector<InferenceStep> trace;
        FactBase finalFacts;

        void print(const KnowledgeBase &kb) const;
    };
}

#endif // CHAINER_CHAIN_RESULT_H
