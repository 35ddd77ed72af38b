#ifndef VARIABLE_NODE_H
#define VARIABLE_NODE_H

#include "Node.h"

namespace AST
{
    class VariableNode : public Node
    {
    public:
        VariableNode(const std::string &n) { this->Node::name = n; }
        NodeType getType() const override { return VARIABLE; }
    };
}

#endif // VARIABLE_NODE_H
