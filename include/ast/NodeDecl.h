/**
 * @file
 * @brief One `title: ...` / `---` / `===` block.
 */
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "ast/Node.h"
#include "ast/Stmt.h"

namespace spindle::ast {
    struct NodeDecl final : Node {
        std::string title;
        std::vector<std::string> tags;
        // Every header in source order, including title and tags.
        std::vector<std::pair<std::string, std::string>> headers;
        std::string rawBody; // body lines as written, newline separated
        int bodyLine{0};     // source line of the first body line
        Body body;

        NodeDecl() : Node(NodeKind::NodeDecl) {}

        std::optional<std::string> header(const std::string& key) const {
            for (const auto& [k, v] : headers) {
                if (k == key) { return v; }
            }
            return std::nullopt;
        }
        bool hasTag(const std::string& tag) const {
            for (const auto& t : tags) {
                if (t == tag) { return true; }
            }
            return false;
        }
    };
} // namespace spindle::ast
