#ifndef CHAINER_TRACE_SERIALIZER_H
#define CHAINER_TRACE_SERIALIZER_H

#include <vector>
#include <nlohmann/json.hpp>
#include "KnowledgeBase.h"
#include "ChainResult.h"

using json = nlohmann::json;

namespace Chainer
{
    // 推理结果转 JSON，符号用知识库中的名字
    class TraceSerializer
    {
    public:
        static json serializeSubstitution(const Substitution &sub, const KnowledgeBase &kb);

        static json serializeStep(const InferenceStep &step, const std::vector<Rule> &rules,
                                  const KnowledgeBase &kb);

        ////////////////////////////
        // {"proven", "state", "rounds", "trace": [...], "facts": [...]}
        static json serializeResult(const ChainResult &result, const std::vector<Rule> &rules,
                                    const KnowledgeBase &kb);
    };
}

#endif // CHAINER_TRACE_SERIALIZER_H
