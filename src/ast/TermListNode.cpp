#include "TermListNode.h"

void AST::TermListNode::append(AST::Node *term)
{
    this->arguments.push_back(term);
}

AST::TermListNode::~TermListNode()
{
    for (Node *node : this->arguments)
    {
        delete node;
    }
    arguments.clear();
}
