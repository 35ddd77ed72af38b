#include "FactParser.h"
#include "FactLexer.h"
#include "Errors.h"
#include "fact.tab.hh" // Bison 生成的头文件

namespace Chainer
{
    std::unique_ptr<AST::PredicateNode> FactParser::parseTree(const std::string &text)
    {
        FactLexer lexer(text);
        AST::PredicateNode *root = nullptr;
        int status = fact_parse(lexer.getScanner(), &root);
        std::unique_ptr<AST::PredicateNode> tree(root);

        if (status != 0 || !tree)
        {
            if (lexer.failed())
            {
                throw ParseError(text, lexer.getErrorColumn(), lexer.getError());
            }
            throw ParseError(text, 1, status == 2 ? "parser stack exhausted" : "not a fact");
        }
        return tree;
    }

    Fact FactParser::buildFact(const AST::PredicateNode &node, KnowledgeBase &kb)
    {
        int predicateId = kb.addPredicate(node.name);
        std::vector<Term> arguments;

        for (const AST::Node *arg : node.termlists->arguments)
        {
            if (arg->getType() == AST::Node::VARIABLE)
            {
                arguments.push_back(kb.addVariable(arg->name));
            }
            else if (arg->getType() == AST::Node::CONSTANT)
            {
                arguments.push_back(kb.addConstant(arg->name));
            }
        }

        // 这里只检查，参数个数在事实、规则或查询被接受时才登记
        kb.validateArity(predicateId, arguments.size());
        return Fact(predicateId, arguments);
    }

    Fact FactParser::parseFact(const std::string &text, KnowledgeBase &kb)
    {
        auto tree = parseTree(text);
        return buildFact(*tree, kb);
    }

    Fact FactParser::parseGroundFact(const std::string &text, KnowledgeBase &kb)
    {
        Fact fact = parseFact(text, kb);
        if (!fact.isGround())
        {
            throw ParseError(text, 1, "facts must not contain variables");
        }
        return fact;
    }

    Fact FactParser::parseQuery(const std::string &text, KnowledgeBase &kb)
    {
        Fact query = parseFact(text, kb);
        if (!query.isGround())
        {
            throw InvalidQueryError("query " + query.toString(kb) + " contains a variable");
        }
        kb.checkArity(query.getPredicateId(), query.arity());
        return query;
    }

    Rule FactParser::parseRule(const std::vector<std::string> &premises, const std::string &conclusion,
                               KnowledgeBase &kb)
    {
        std::vector<Fact> premiseFacts;
        premiseFacts.reserve(premises.size());
        for (const auto &premise : premises)
        {
            premiseFacts.push_back(parseFact(premise, kb));
        }
        return Rule(premiseFacts, parseFact(conclusion, kb), kb);
    }

    void FactParser::addFact(const std::string &text, KnowledgeBase &kb)
    {
        kb.addFact(parseGroundFact(text, kb));
    }

    void FactParser::addRule(const std::vector<std::string> &premises, const std::string &conclusion,
                             KnowledgeBase &kb)
    {
        kb.addRule(parseRule(premises, conclusion, kb));
    }
}
