/***
 * Name: spindle::sema::NodeTrackingVisitor (impl)
 * Purpose: Collect tracked and opted-out node names.
 */
#include "sema/NodeTrackingVisitor.h"
#include "runtime/Library.h"

namespace spindle::sema {

void NodeTrackingVisitor::visit(const ast::NodeDecl& n) {
  if (const auto tracking = n.header("tracking")) {
    if (*tracking == "always") { tracked_.insert(n.title); }
    if (*tracking == "never") { ignored_.insert(n.title); }
  }
  ast::Walker::visit(n);
}

void NodeTrackingVisitor::visit(const ast::Call& c) {
  if ((c.callee == rt::Library::kVisitedFunction || c.callee == rt::Library::kVisitedCountFunction) &&
      c.args.size() == 1 && c.args[0]->kind == ast::NodeKind::StringLiteral) {
    tracked_.insert(static_cast<const ast::StringLiteral&>(*c.args[0]).value);
  }
  ast::Walker::visit(c);
}

} // namespace spindle::sema
