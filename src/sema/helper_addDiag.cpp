/***
 * Name: addDiag
 * Purpose: Append a diagnostic message with optional source location to the vector.
 */
#include "sema/detail/Helpers.h"

#include <algorithm>
#include <utility>

namespace spindle::sema {
    void addDiag(std::vector<Diagnostic> &diags, const std::string &msg, const ast::Node *n) {
        addDiag(diags, Severity::Error, msg, n);
    }

    void addDiag(std::vector<Diagnostic> &diags, const Severity severity, const std::string &msg, const ast::Node *n) {
        Diagnostic diag;
        diag.severity = severity;
        diag.message = msg;
        if (n != nullptr) {
            diag.file = n->file;
            diag.line = n->line;
            diag.col = n->col;
        }
        diags.push_back(std::move(diag));
    }

    void addDiag(std::vector<Diagnostic> &diags, const Severity severity, const std::string &msg,
                 const std::string &file, const int line, const int col) {
        Diagnostic diag;
        diag.severity = severity;
        diag.message = msg;
        diag.file = file;
        diag.line = line;
        diag.col = col;
        diags.push_back(std::move(diag));
    }

    void dedupDiagnostics(std::vector<Diagnostic> &diags) {
        std::sort(diags.begin(), diags.end());
        diags.erase(std::unique(diags.begin(), diags.end()), diags.end());
    }

    bool hasErrors(const std::vector<Diagnostic> &diags) {
        return std::any_of(diags.begin(), diags.end(), [](const Diagnostic &d) { return d.isError(); });
    }
} // namespace spindle::sema
