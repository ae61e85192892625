/**
 * @file
 * @brief A line of narrative text delivered to the line handler.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Stmt.h"
#include "ast/InterpolatedText.h"

namespace spindle::ast {
    struct LineStmt final : Stmt {
        InterpolatedText text;
        std::vector<std::string> hashtags; // without the leading '#'
        // Assigned while building the string table.
        mutable std::string lineId{};
        LineStmt() : Stmt(NodeKind::LineStmt) {}
    };
} // namespace spindle::ast
