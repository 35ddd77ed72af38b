#include "PredicateNode.h"

AST::PredicateNode::~PredicateNode()
{
    delete this->termlists;
}
