/**
 * @file
 * @brief AST root: one parsed script file.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/NodeDecl.h"

namespace spindle::ast {
    struct File final : Node {
        std::vector<std::string> fileTags; // `#tag` lines before the first node
        std::vector<std::unique_ptr<NodeDecl>> nodes;
        File() : Node(NodeKind::File) {}
    };
} // namespace spindle::ast
