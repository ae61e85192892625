/***
 * Name: spindle::sema::NodeTrackingVisitor
 * Purpose: Find nodes whose visits must be counted.
 * Outputs:
 *   - tracked(): names passed as string literals to visited()/visited_count(),
 *     plus nodes with a `tracking: always` header
 *   - ignored(): nodes with a `tracking: never` header
 */
#pragma once

#include <set>
#include <string>

#include "ast/Walker.h"

namespace spindle::sema {

class NodeTrackingVisitor : public ast::Walker {
 public:
  void collect(const ast::File& file) { file.accept(*this); }

  const std::set<std::string>& tracked() const { return tracked_; }
  const std::set<std::string>& ignored() const { return ignored_; }

  using ast::Walker::visit;
  void visit(const ast::NodeDecl& n) override;
  void visit(const ast::Call& c) override;

 private:
  std::set<std::string> tracked_{};
  std::set<std::string> ignored_{};
};

} // namespace spindle::sema
