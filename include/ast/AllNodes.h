#ifndef ALL_NODES_H
#define ALL_NODES_H

#include "Node.h"
#include "VariableNode.h"
#include "ConstantNode.h"
#include "TermListNode.h"
#include "PredicateNode.h"

#endif // ALL_NODES_H
