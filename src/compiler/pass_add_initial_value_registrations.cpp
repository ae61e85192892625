/***
 * Name: spindle::compiler::addInitialValueRegistrations
 * Purpose: Pass 7. Record variable defaults in the Program and finish the result.
 */
#include "CompilationState.h"
#include "sema/detail/Helpers.h"

namespace spindle::compiler {

CompilationState addInitialValueRegistrations(CompilationState state) {
    for (const auto& decl : state.knownDeclarations) {
        if (decl.isFunction()) { continue; }
        if (!decl.defaultValue) {
            sema::addDiag(state.diagnostics, sema::Severity::Error,
                          "'" + decl.name + "' has no default value; give it one with <<declare " + decl.name +
                              " = ...>>",
                          decl.file, decl.line, 1);
            continue;
        }
        if (state.program) { state.program->initialValues[decl.name] = *decl.defaultValue; }
    }
    sema::dedupDiagnostics(state.diagnostics);
    return state;
}

} // namespace spindle::compiler
