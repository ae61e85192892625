/***
 * Name: spindle::compiler::findTrackingNodes
 * Purpose: Pass 4. Decide which nodes count their visits.
 */
#include "CompilationState.h"
#include "sema/NodeTrackingVisitor.h"

namespace spindle::compiler {

CompilationState findTrackingNodes(CompilationState state) {
    for (const auto& file : state.parsedFiles) {
        sema::NodeTrackingVisitor visitor;
        visitor.collect(*file.tree);
        state.trackingNodes.insert(visitor.tracked().begin(), visitor.tracked().end());
        state.ignoreTrackingNodes.insert(visitor.ignored().begin(), visitor.ignored().end());
    }
    // `tracking: never` wins over any use of visited().
    for (const auto& name : state.ignoreTrackingNodes) { state.trackingNodes.erase(name); }
    return state;
}

} // namespace spindle::compiler
