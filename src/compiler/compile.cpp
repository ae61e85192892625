/***
 * Name: spindle::compiler::compile
 * Purpose: Run the pass pipeline selected by the job's compilation type.
 */
#include "compiler/Compiler.h"
#include "CompilationState.h"
#include "observability/AstPrinter.h"
#include "observability/Metrics.h"
#include "sema/detail/Helpers.h"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace spindle::compiler {

namespace {

struct Pass {
    const char* name;
    std::function<CompilationState(CompilationState)> run;
};

std::vector<Pass> passesFor(const CompilationType type) {
    const Pass strings{"register_strings", registerStrings};
    const Pass declarations{"get_declarations", getDeclarations};
    const Pass types{"check_types", checkTypes};
    const Pass tracking{"find_tracking_nodes", findTrackingNodes};
    const Pass trackingDecls{"add_tracking_declarations", addTrackingDeclarations};
    const Pass code{"generate_code", generateCode};
    const Pass initialValues{"add_initial_value_registrations", addInitialValueRegistrations};
    switch (type) {
        case CompilationType::StringsOnly: return {strings, initialValues};
        case CompilationType::DeclarationsOnly: return {strings, declarations, initialValues};
        case CompilationType::TypeCheck: return {strings, declarations, types, tracking, trackingDecls, initialValues};
        case CompilationType::FullCompilation:
        default: return {strings, declarations, types, tracking, trackingDecls, code, initialValues};
    }
}

} // namespace

bool CompilationResult::hasErrors() const { return sema::hasErrors(diagnostics); }

CompilationResult compile(const CompilationJob& job, obs::Metrics* metrics) {
    CompilationState state;
    state.job = &job;
    state.metrics = metrics;
    state.knownDeclarations = seedDeclarations(job);

    for (const auto& pass : passesFor(job.compilationType)) {
        const std::string timer = std::string("compile.") + pass.name;
        if (metrics != nullptr) { metrics->start(timer); }
        state = pass.run(std::move(state));
        if (metrics != nullptr) { metrics->stop(timer); }
    }

    CompilationResult result;
    result.program = std::move(state.program);
    result.stringTable = std::move(state.stringTable);
    result.declarations = std::move(state.derivedDeclarations);
    result.containsImplicitStringTags = state.containsImplicitStringTags;
    result.fileTags = std::move(state.fileTags);
    result.diagnostics = std::move(state.diagnostics);
    result.debugInfo = std::move(state.debugInfos);

    if (metrics != nullptr) {
        std::uint64_t nodes = 0;
        obs::AstGeometry geometry;
        for (const auto& file : state.parsedFiles) {
            nodes += file.tree->nodes.size();
            obs::AstPrinter printer;
            (void) printer.print(*file.tree);
            geometry.nodes += printer.geometry().nodes;
            geometry.maxDepth = std::max(geometry.maxDepth, printer.geometry().maxDepth);
        }
        metrics->setAstGeometry(geometry);
        metrics->setCounter("compile.files", job.files.size());
        metrics->setCounter("compile.nodes", nodes);
        metrics->setCounter("compile.strings", result.stringTable.size());
        metrics->setCounter("compile.diagnostics", result.diagnostics.size());
    }
    return result;
}

} // namespace spindle::compiler
