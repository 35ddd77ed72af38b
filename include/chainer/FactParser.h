#ifndef CHAINER_FACT_PARSER_H
#define CHAINER_FACT_PARSER_H

#include <string>
#include <vector>
#include <memory>
#include "KnowledgeBase.h"
#include "AllNodes.h"

namespace Chainer
{
    // 文本 -> AST -> Fact/Rule，新出现的谓词和符号登记到知识库
    class FactParser
    {
    public:
        // 解析事实模板（可以含变量），格式错误抛出 ParseError
        static Fact parseFact(const std::string &text, KnowledgeBase &kb);
        // 初始事实必须是基事实
        static Fact parseGroundFact(const std::string &text, KnowledgeBase &kb);
        // 查询含变量时抛出 InvalidQueryError
        static Fact parseQuery(const std::string &text, KnowledgeBase &kb);
        static Rule parseRule(const std::vector<std::string> &premises, const std::string &conclusion,
                              KnowledgeBase &kb);

        static void addFact(const std::string &text, KnowledgeBase &kb);
        static void addRule(const std::vector<std::string> &premises, const std::string &conclusion,
                            KnowledgeBase &kb);

    private:
        static std::unique_ptr<AST::PredicateNode> parseTree(const std::string &text);
        static Fact buildFact(const AST::PredicateNode &node, KnowledgeBase &kb);
    };
}

#endif // CHAINER_FACT_PARSER_H
