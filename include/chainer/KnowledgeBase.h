#ifndef CHAINER_KNOWLEDGE_BASE_H
#define CHAINER_KNOWLEDGE_BASE_H

#include <vector>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <optional>
#include "SymbolTable.h"
#include "Fact.h"
#include "Rule.h"
#include "Term.h"

namespace Chainer
{
    class KnowledgeBase
    {
    public:
        explicit KnowledgeBase(bool strictArity = true);

        int addPredicate(const std::string &predicate);
        Term addVariable(const std::string &variable);
        Term addConstant(const std::string &constant);

        // 严格模式下同一谓词的参数个数必须一致，否则抛出 ArityMismatchError
        // validateArity 只检查；checkArity 检查通过后登记，首次出现的谓词以此为准
        void validateArity(int predicateId, size_t arity) const;
        void checkArity(int predicateId, size_t arity);
        void setStrictArity(bool strict) { strictArity = strict; }
        bool isStrictArity() const { return strictArity; }

        // 只接受基事实，重复的事实忽略
        void addFact(const Fact &fact);
        // 规则中任何一个原子的参数个数不符时整条规则被拒绝，不登记任何参数个数
        void addRule(const Rule &rule);

        const std::vector<Fact> &getFacts() const;
        const std::vector<Rule> &getRules() const;

        const std::string &getPredicateName(int id) const;
        const std::string &getSymbolName(const Term &term) const;

        bool hasFact(const Fact &fact) const;

        std::optional<int> getPredicateId(const std::string &predicateName) const;
        std::optional<Term> getSymbolId(const std::string &symbolName) const;

        size_t constantCount() const { return constantTable.size(); }

        void print() const;

    private:
        bool strictArity;
        SymbolTable predicateTable;
        SymbolTable variableTable;
        SymbolTable constantTable;
        std::unordered_map<int, size_t> predicateArity; // PredicateId -> 参数个数
        std::vector<Fact> facts;
        std::unordered_set<Fact> factIndex;
        std::vector<Rule> rules;
    };
}

#endif // CHAINER_KNOWLEDGE_BASE_H
