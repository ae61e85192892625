#pragma once
#include <memory>
#include <string>
#include <vector>

#include "Expr.h"

namespace spindle::ast {

    struct Call final : Expr {
        std::string callee;
        std::vector<std::unique_ptr<Expr>> args;
        explicit Call(std::string c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace spindle::ast
