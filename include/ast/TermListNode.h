#ifndef TERMLIST_NODE_H
#define TERMLIST_NODE_H

#include "Node.h"

namespace AST
{
    class TermListNode : public Node
    {
    public:
        std::vector<Node *> arguments; // 变量或常量，按出现顺序

        TermListNode() {}
        void append(Node *term); // 接管 term 的所有权
        NodeType getType() const override { return TERMLIST; }
        ~TermListNode();
    };
}
#endif // TERMLIST_NODE_H
