#include "ForwardChainer.h"
#include "PremiseSolver.h"
#include "Errors.h"
#include <algorithm>
#include <functional>
#include <future>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <unordered_set>

namespace Chainer
{
    ForwardChainer::ForwardChainer(const ChainerOptions &options) : options(options)
    {
        if (options.roundCap <= 0)
        {
            throw std::invalid_argument("round cap must be positive, got " + std::to_string(options.roundCap));
        }
    }

    void ForwardChainer::requestStop()
    {
        stopRequested.store(true);
    }

    unsigned ForwardChainer::effectiveThreads() const
    {
        if (options.workerThreads != 0)
        {
            return options.workerThreads;
        }
        unsigned n = std::thread::hardware_concurrency();
        return n == 0 ? 1 : n;
    }

    ChainResult ForwardChainer::run(const KnowledgeBase &kb, const Fact &query)
    {
        return run(kb.getFacts(), kb.getRules(), query, kb);
    }

    std::vector<InferenceStep> ForwardChainer::applyRule(const Rule &rule, size_t ruleIndex, int round,
                                                         const FactBase &snapshot)
    {
        std::vector<InferenceStep> steps;
        std::unordered_set<Fact> produced;

        SubstitutionStream stream = PremiseSolver::solve(rule.getPremises(), snapshot);
        while (auto sub = stream.next())
        {
            Fact derived = sub->apply(rule.getConclusion());
            if (snapshot.contains(derived) || !produced.insert(derived).second)
            {
                continue;
            }
            steps.push_back({round, ruleIndex, *sub, stream.matchedFacts(), derived});
        }
        return steps;
    }

    std::vector<std::vector<InferenceStep>> ForwardChainer::evaluateRules(const std::vector<Rule> &rules, int round,
                                                                          const FactBase &snapshot) const
    {
        std::vector<std::vector<InferenceStep>> batches(rules.size());
        unsigned threads = effectiveThreads();

        if (threads <= 1 || rules.size() <= 1)
        {
            for (size_t i = 0; i < rules.size(); ++i)
            {
                batches[i] = applyRule(rules[i], i, round, snapshot);
            }
            return batches;
        }

        // 每批最多 threads 条规则并发求值，只读快照，结果按规则下标放回
        for (size_t begin = 0; begin < rules.size(); begin += threads)
        {
            size_t end = std::min(rules.size(), begin + threads);
            std::vector<std::future<std::vector<InferenceStep>>> workers;
            workers.reserve(end - begin);
            for (size_t i = begin; i < end; ++i)
            {
                workers.push_back(std::async(std::launch::async, &ForwardChainer::applyRule,
                                             std::cref(rules[i]), i, round, std::cref(snapshot)));
            }
            for (size_t i = begin; i < end; ++i)
            {
                batches[i] = workers[i - begin].get();
            }
        }
        return batches;
    }

    ChainResult ForwardChainer::run(const std::vector<Fact> &initialFacts, const std::vector<Rule> &rules,
                                    const Fact &query, const KnowledgeBase &kb)
    {
        if (!query.isGround())
        {
            throw InvalidQueryError("query " + query.toString(kb) + " contains a variable");
        }
        for (const auto &fact : initialFacts)
        {
            if (!fact.isGround())
            {
                throw std::invalid_argument("initial fact " + fact.toString(kb) + " contains a variable");
            }
        }

        ChainResult result;
        result.finalFacts = FactBase(initialFacts);
        FactBase &factBase = result.finalFacts;

        if (options.verbose)
        {
            std::cout << "Starting forward chaining" << std::endl;
            factBase.print(kb);
            std::cout << "Query to prove: " << query.toString(kb) << std::endl;
        }

        if (factBase.contains(query))
        {
            result.proven = true;
            result.state = ChainState::QUERY_PROVEN;
            if (options.verbose)
            {
                std::cout << "Query " << query.toString(kb) << " is an initial fact" << std::endl;
            }
            return result;
        }

        for (int round = 1;; ++round)
        {
            if (round > options.roundCap)
            {
                result.state = ChainState::ROUND_CAP_EXCEEDED;
                if (options.verbose)
                {
                    std::cout << "Round cap " << options.roundCap << " reached without a fixpoint" << std::endl;
                }
                break;
            }
            // 停止请求在这里被消费，之后的 run 不受影响
            if (stopRequested.exchange(false))
            {
                result.state = ChainState::CANCELLED;
                break;
            }

            if (options.verbose)
            {
                std::cout << "--- Round " << round << " ---" << std::endl;
            }

            // 本轮所有规则只读同一个事实库，合并在所有规则求值结束后进行
            auto batches = evaluateRules(rules, round, factBase);

            std::vector<InferenceStep> batch;
            std::unordered_set<Fact> collected;
            for (auto &ruleSteps : batches)
            {
                for (auto &step : ruleSteps)
                {
                    if (collected.insert(step.derived).second)
                    {
                        batch.push_back(std::move(step));
                    }
                }
            }

            if (batch.empty())
            {
                result.state = ChainState::CONVERGED;
                if (options.verbose)
                {
                    std::cout << "No new facts can be inferred. Halting." << std::endl;
                }
                break;
            }

            for (const auto &step : batch)
            {
                if (options.verbose)
                {
                    logStep(step, rules, kb);
                }
                factBase.insert(step.derived);
                result.trace.push_back(step);
            }
            result.rounds = round;

            if (options.verbose)
            {
                std::cout << "Merged " << batch.size() << " new facts, fact base size " << factBase.size() << std::endl;
            }

            if (factBase.contains(query))
            {
                result.proven = true;
                result.state = ChainState::QUERY_PROVEN;
                if (options.verbose)
                {
                    std::cout << "Goal " << query.toString(kb) << " found in round " << round << std::endl;
                }
                break;
            }
        }

        return result;
    }

    void ForwardChainer::logStep(const InferenceStep &step, const std::vector<Rule> &rules,
                                 const KnowledgeBase &kb) const
    {
        std::cout << "Applied rule [" << step.ruleIndex << "]: " << rules[step.ruleIndex].toString(kb) << std::endl;
        std::cout << "   - With facts: ";
        for (size_t i = 0; i < step.sourceFacts.size(); ++i)
        {
            std::cout << step.sourceFacts[i].toString(kb);
            if (i < step.sourceFacts.size() - 1)
            {
                std::cout << " & ";
            }
        }
        std::cout << std::endl;
        std::cout << "   - Using substitution: " << step.substitution.toString(kb) << std::endl;
        std::cout << "   ==> Inferred: " << step.derived.toString(kb) << std::endl;
    }
}
