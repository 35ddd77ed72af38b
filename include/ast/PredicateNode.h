#ifndef PREDICATE_NODE_H
#define PREDICATE_NODE_H

#include "Node.h"
#include "TermListNode.h"

namespace AST
{
    class PredicateNode : public Node
    {
    public:
        TermListNode *termlists; // 拥有所有权，零参数时为空列表

        PredicateNode(const std::string &n) : termlists(new TermListNode()) { this->Node::name = n; }
        PredicateNode(const std::string &n, TermListNode *term_lists) : termlists(term_lists) { this->Node::name = n; }
        PredicateNode(const PredicateNode &) = delete;
        PredicateNode &operator=(const PredicateNode &) = delete;
        NodeType getType() const override { return PREDICATE; }
        ~PredicateNode();
    };
}
#endif // PREDICATE_NODE_H
