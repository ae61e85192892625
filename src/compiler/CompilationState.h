/***
 * Name: spindle::compiler::CompilationState
 * Purpose: Accumulator threaded by value through the compiler passes.
 * Theory of Operation:
 *   Parsed trees are shared_ptr so copying the state between passes is
 *   cheap; the type checker's per-expression types live on the trees as
 *   annotations and are read back by codegen.
 */
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "ast/File.h"
#include "codegen/Codegen.h"
#include "compiler/Compiler.h"

namespace spindle::compiler {

struct ParsedFile {
    std::string name;
    std::shared_ptr<const ast::File> tree;
};

struct CompilationState {
    const CompilationJob* job{nullptr};
    obs::Metrics* metrics{nullptr};
    std::vector<ParsedFile> parsedFiles{};
    std::vector<sema::Declaration> knownDeclarations{};
    std::vector<sema::Declaration> derivedDeclarations{};
    std::vector<sema::Diagnostic> diagnostics{};
    StringTable stringTable{};
    bool containsImplicitStringTags{false};
    std::map<std::string, std::vector<std::string>> fileTags{};
    std::set<std::string> trackingNodes{};
    std::set<std::string> ignoreTrackingNodes{};
    std::optional<ir::Program> program{};
    std::map<std::string, codegen::DebugInfo> debugInfos{};
};

CompilationState registerStrings(CompilationState state);
CompilationState getDeclarations(CompilationState state);
CompilationState checkTypes(CompilationState state);
CompilationState findTrackingNodes(CompilationState state);
CompilationState addTrackingDeclarations(CompilationState state);
CompilationState generateCode(CompilationState state);
CompilationState addInitialValueRegistrations(CompilationState state);

} // namespace spindle::compiler
