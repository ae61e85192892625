/***
 * Name: spindle::compiler::checkTypes
 * Purpose: Pass 3. Type check every file, re-checking files whose variable
 *          types depend on other files.
 */
#include "CompilationState.h"
#include "sema/TypeChecker.h"

#include <vector>

namespace spindle::compiler {

CompilationState checkTypes(CompilationState state) {
    std::vector<const ParsedFile*> deferred;
    for (const auto& file : state.parsedFiles) {
        std::vector<sema::Diagnostic> diags;
        std::vector<sema::Declaration> inferred;
        sema::TypeChecker checker(state.knownDeclarations, inferred, diags);
        const bool complete = checker.check(*file.tree, false);
        state.derivedDeclarations.insert(state.derivedDeclarations.end(), inferred.begin(), inferred.end());
        if (complete) {
            state.diagnostics.insert(state.diagnostics.end(), diags.begin(), diags.end());
        } else {
            deferred.push_back(&file);
        }
    }
    for (const ParsedFile* file : deferred) {
        std::vector<sema::Declaration> inferred;
        sema::TypeChecker checker(state.knownDeclarations, inferred, state.diagnostics);
        checker.check(*file->tree, true);
        state.derivedDeclarations.insert(state.derivedDeclarations.end(), inferred.begin(), inferred.end());
    }
    return state;
}

} // namespace spindle::compiler
