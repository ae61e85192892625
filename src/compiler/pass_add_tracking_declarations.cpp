/***
 * Name: spindle::compiler::addTrackingDeclarations
 * Purpose: Pass 5. Declare a hidden visit counter per tracked node.
 */
#include "CompilationState.h"
#include "runtime/Library.h"

namespace spindle::compiler {

CompilationState addTrackingDeclarations(CompilationState state) {
    for (const auto& node : state.trackingNodes) {
        auto decl = sema::Declaration::variable(rt::Library::generateUniqueVisitedVariableForNode(node),
                                                rt::ValueType::Number, rt::Value::Number(0.0),
                                                sema::DeclarationSource::Derived);
        decl.description = "The generated variable for tracking visits of node " + node;
        decl.node = node;
        if (sema::findDeclaration(state.knownDeclarations, decl.name) == nullptr) {
            state.knownDeclarations.push_back(decl);
        }
        state.derivedDeclarations.push_back(std::move(decl));
    }
    return state;
}

} // namespace spindle::compiler
