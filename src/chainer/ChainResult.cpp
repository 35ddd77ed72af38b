#include "ChainResult.h"
#include "KnowledgeBase.h"
#include <iostream>

namespace Chainer
{
    std::string chainStateToString(ChainState state)
    {
        switch (state)
        {
        case ChainState::RUNNING:
            return "RUNNING";
        case ChainState::CONVERGED:
            return "CONVERGED";
        case ChainState::QUERY_PROVEN:
            return "QUERY_PROVEN";
        case ChainState::ROUND_CAP_EXCEEDED:
            return "ROUND_CAP_EXCEEDED";
        case ChainState::CANCELLED:
            return "CANCELLED";
        }
        return "UNKNOWN";
    }

    void ChainResult::print(const KnowledgeBase &kb) const
    {
        std::cout << "State: " << chainStateToString(state)
                  << ", proven: " << (proven ? "true" : "false")
                  << ", rounds: " << rounds << std::endl;
        std::cout << "Trace (" << trace.size() << " steps):" << std::endl;
        for (const auto &step : trace)
        {
            std::cout << "  [round " << step.round << "] rule " << step.ruleIndex << " "
                      << step.substitution.toString(kb) << ": ";
            for (size_t i = 0; i < step.sourceFacts.size(); ++i)
            {
                std::cout << step.sourceFacts[i].toString(kb);
                if (i < step.sourceFacts.size() - 1)
                {
                    std::cout << " & ";
                }
            }
            std::cout << " => " << step.derived.toString(kb) << std::endl;
        }
        finalFacts.print(kb);
    }
}
