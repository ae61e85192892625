/***
 * Name: spindle::compiler::generateCode
 * Purpose: Pass 6. Emit a Program per file and combine them.
 */
#include "CompilationState.h"
#include "sema/detail/Helpers.h"

#include <string>
#include <utility>

namespace spindle::compiler {

CompilationState generateCode(CompilationState state) {
    if (sema::hasErrors(state.diagnostics)) { return state; }

    ir::Program combined;
    bool collided = false;
    for (const auto& file : state.parsedFiles) {
        codegen::Codegen generator(state.trackingNodes);
        auto result = generator.generate(*file.tree);
        state.diagnostics.insert(state.diagnostics.end(), result.diagnostics.begin(), result.diagnostics.end());
        collided = collided || !result.diagnostics.empty();

        for (auto& [name, node] : result.program.nodes) {
            if (combined.nodes.count(name) != 0) {
                const auto& first = state.debugInfos[name];
                const auto& info = result.debugInfos[name];
                const int line = info.lineInfos.empty() ? 0 : info.lineInfos.begin()->second.first;
                sema::addDiag(state.diagnostics, sema::Severity::Error,
                              "duplicate node name '" + name + "' (also defined in " + first.fileName + ")",
                              file.name, line, 1);
                collided = true;
                continue;
            }
            combined.nodes.emplace(name, std::move(node));
            state.debugInfos[name] = std::move(result.debugInfos[name]);
        }
    }
    if (!collided) { state.program = std::move(combined); }
    return state;
}

} // namespace spindle::compiler
