#pragma once

#include <memory>
#include <vector>
#include "ast/Stmt.h"
#include "ast/OptionItem.h"

namespace spindle::ast {
    struct OptionGroup final : Stmt {
        std::vector<std::unique_ptr<OptionItem>> options;
        OptionGroup() : Stmt(NodeKind::OptionGroup) {}
    };
} // namespace spindle::ast
