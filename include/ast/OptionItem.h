/**
 * @file
 * @brief One `-> text` choice and the block it leads to.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Stmt.h"
#include "ast/Expr.h"
#include "ast/InterpolatedText.h"

namespace spindle::ast {
    struct OptionItem final : Node {
        InterpolatedText text;
        std::vector<std::string> hashtags;
        std::unique_ptr<Expr> condition; // `<<if cond>>`, may be null
        mutable std::string lineId{};
        Body body;
        OptionItem() : Node(NodeKind::OptionItem) {}
    };
} // namespace spindle::ast
