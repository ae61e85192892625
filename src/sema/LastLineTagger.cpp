/***
 * Name: spindle::sema::tagLastLines
 * Purpose: Add the `lastline` hashtag to lines directly followed by options.
 */
#include "sema/LastLineTagger.h"
#include "ast/Nodes.h"

#include <algorithm>
#include <memory>
#include <vector>

namespace spindle::sema {

static void tagBody(ast::Body& body) {
    for (std::size_t i = 0; i < body.size(); ++i) {
        ast::Stmt& stmt = *body[i];
        if (stmt.kind == ast::NodeKind::LineStmt && i + 1 < body.size() &&
            body[i + 1]->kind == ast::NodeKind::OptionGroup) {
            auto& tags = static_cast<ast::LineStmt&>(stmt).hashtags;
            if (std::find(tags.begin(), tags.end(), kLastLineTag) == tags.end()) { tags.emplace_back(kLastLineTag); }
        } else if (stmt.kind == ast::NodeKind::OptionGroup) {
            for (auto& option : static_cast<ast::OptionGroup&>(stmt).options) { tagBody(option->body); }
        } else if (stmt.kind == ast::NodeKind::IfStmt) {
            for (auto& clause : static_cast<ast::IfStmt&>(stmt).clauses) { tagBody(clause.body); }
        }
    }
}

void tagLastLines(ast::File& file) {
    for (auto& node : file.nodes) { tagBody(node->body); }
}

} // namespace spindle::sema
