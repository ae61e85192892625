/**
 * @file
 * @brief Statement base and the statement block shared by nodes, options and if arms.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Node.h"

namespace spindle::ast {
    struct Stmt : Node {
        using Node::Node;
    };

    // Statements of one indentation block, in source order.
    using Body = std::vector<std::unique_ptr<Stmt>>;
}
