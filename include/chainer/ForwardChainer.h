#ifndef CHAINER_FORWARD_CHAINER_H
#define CHAINER_FORWARD_CHAINER_H

#include <atomic>
#include <vector>
#include "KnowledgeBase.h"
#include "FactBase.h"
#include "Rule.h"
#include "ChainResult.h"

namespace Chainer
{
    struct ChainerOptions
    {
        int roundCap = 1000;          // 必须为正
        unsigned workerThreads = 1;   // 0 表示使用硬件线程数
        bool verbose = false;         // 逐轮输出推理过程
    };

    // 半朴素前向链：第 k 轮产生的事实从第 k+1 轮起才可见
    class ForwardChainer
    {
    public:
        explicit ForwardChainer(const ChainerOptions &options = ChainerOptions());

        // 使用知识库中的初始事实和规则
        ChainResult run(const KnowledgeBase &kb, const Fact &query);
        ChainResult run(const std::vector<Fact> &initialFacts, const std::vector<Rule> &rules,
                        const Fact &query, const KnowledgeBase &kb);

        // 在下一轮开始前停止，可以从其他线程调用
        void requestStop();

        // 单条规则在快照上的求值结果，已去掉快照中已有的事实和本规则内的重复
        static std::vector<InferenceStep> applyRule(const Rule &rule, size_t ruleIndex, int round,
                                                    const FactBase &snapshot);

        const ChainerOptions &getOptions() const { return options; }

    private:
        ChainerOptions options;
        std::atomic<bool> stopRequested{false};

        std::vector<std::vector<InferenceStep>> evaluateRules(const std::vector<Rule> &rules, int round,
                                                              const FactBase &snapshot) const;
        unsigned effectiveThreads() const;
        void logStep(const InferenceStep &step, const std::vector<Rule> &rules, const KnowledgeBase &kb) const;
    };
}

#endif // CHAINER_FORWARD_CHAINER_H
