/***
 * Name: spindle::ast::Node
 * Purpose: Kind-switch dispatch and location formatting shared by all nodes.
 */
#include "ast/Node.h"
#include "ast/Visitor.h"

#include <string>

namespace spindle::ast {

void Node::accept(VisitorBase& visitor) const { dispatch(*this, visitor); }

std::string Node::where() const { return file + ":" + std::to_string(line); }

} // namespace spindle::ast
