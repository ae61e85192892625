/***
 * Name: spindle::compiler::getDeclarations
 * Purpose: Pass 2. Collect <<declare>> statements and file tags.
 */
#include "CompilationState.h"
#include "sema/DeclarationCollector.h"

namespace spindle::compiler {

CompilationState getDeclarations(CompilationState state) {
    for (const auto& file : state.parsedFiles) {
        sema::DeclarationCollector collector(state.knownDeclarations, state.diagnostics);
        const auto found = collector.collect(*file.tree);
        state.knownDeclarations.insert(state.knownDeclarations.end(), found.begin(), found.end());
        state.derivedDeclarations.insert(state.derivedDeclarations.end(), found.begin(), found.end());
        state.fileTags[file.name] = file.tree->fileTags;
    }
    return state;
}

} // namespace spindle::compiler
