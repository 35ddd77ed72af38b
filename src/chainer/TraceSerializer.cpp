#include "TraceSerializer.h"

namespace Chainer
{
    json TraceSerializer::serializeSubstitution(const Substitution &sub, const KnowledgeBase &kb)
    {
        json sub_json = json::object();
        for (const auto &[var, term] : sub)
        {
            sub_json[kb.getSymbolName(var)] = kb.getSymbolName(term);
        }
        return sub_json;
    }

    json TraceSerializer::serializeStep(const InferenceStep &step, const std::vector<Rule> &rules,
                                        const KnowledgeBase &kb)
    {
        json step_json;
        step_json["round"] = step.round;
        step_json["rule"] = step.ruleIndex;
        if (step.ruleIndex < rules.size())
        {
            step_json["rule_text"] = rules[step.ruleIndex].toString(kb);
        }
        step_json["substitution"] = serializeSubstitution(step.substitution, kb);

        std::vector<std::string> sources;
        for (const auto &fact : step.sourceFacts)
        {
            sources.push_back(fact.toString(kb));
        }
        step_json["sources"] = sources;
        step_json["derived"] = step.derived.toString(kb);
        return step_json;
    }

    json TraceSerializer::serializeResult(const ChainResult &result, const std::vector<Rule> &rules,
                                          const KnowledgeBase &kb)
    {
        json result_json;
        result_json["proven"] = result.proven;
        result_json["state"] = chainStateToString(result.state);
        result_json["rounds"] = result.rounds;

        result_json["trace"] = json::array();
        for (const auto &step : result.trace)
        {
            result_json["trace"].push_back(serializeStep(step, rules, kb));
        }

        std::vector<std::string> facts;
        for (const auto &fact : result.finalFacts)
        {
            facts.push_back(fact.toString(kb));
        }
        result_json["facts"] = facts;
        return result_json;
    }
}
