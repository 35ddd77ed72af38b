#ifndef NODE_H
#define NODE_H

#include <string>
#include <vector>

namespace AST
{
    class Node
    {
    public:
        enum NodeType
        {
            PREDICATE,
            VARIABLE,
            CONSTANT,
            TERMLIST
        };
        std::string name; //节点名字
        virtual NodeType getType() const = 0;
        virtual ~Node() {}
    };
}

#endif // NODE_H
