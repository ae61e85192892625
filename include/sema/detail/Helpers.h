/***
 * Name: spindle::sema helpers
 * Purpose: Shared helpers for the compiler passes.
 */
#pragma once

#include <string>
#include <vector>
#include "ast/Node.h"
#include "sema/Diagnostic.h"

namespace spindle::sema {
    void addDiag(std::vector<Diagnostic> &diags, const std::string &msg, const ast::Node *n);
    void addDiag(std::vector<Diagnostic> &diags, Severity severity, const std::string &msg, const ast::Node *n);
    void addDiag(std::vector<Diagnostic> &diags, Severity severity, const std::string &msg,
                 const std::string &file, int line, int col);

    // Sorts and removes structural duplicates.
    void dedupDiagnostics(std::vector<Diagnostic> &diags);

    bool hasErrors(const std::vector<Diagnostic> &diags);
} // namespace spindle::sema
