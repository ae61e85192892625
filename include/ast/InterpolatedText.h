/***
 * Name: spindle::ast::InterpolatedText
 * Purpose: Author text with embedded `{expr}` substitutions.
 * Theory of Operation:
 *   `text` holds the literal text with each substitution replaced by its
 *   positional marker `{0}`, `{1}`, ...; `substitutions[i]` is the expression
 *   for marker i. Escapes are already resolved.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"

namespace spindle::ast {

struct InterpolatedText {
    std::string text;
    std::vector<std::unique_ptr<Expr>> substitutions;
};

} // namespace spindle::ast
