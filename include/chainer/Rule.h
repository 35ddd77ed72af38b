#ifndef CHAINER_RULE_H
#define CHAINER_RULE_H

#include <vector>
#include <string>
#include "Fact.h"

namespace Chainer
{
    class KnowledgeBase;

    // Horn 规则：premise_1 & ... & premise_n => conclusion
    class Rule
    {
    public:
        // 结论中的每个变量都必须出现在某个前提中，否则抛出 UnsafeRuleError
        Rule(const std::vector<Fact> &premises, const Fact &conclusion, const KnowledgeBase &kb);

        const std::vector<Fact> &getPremises() const;
        const Fact &getConclusion() const;

        std::string toString(const KnowledgeBase &kb) const;

    private:
        std::vector<Fact> premises;
        Fact conclusion;
    };
}

#endif // CHAINER_RULE_H
