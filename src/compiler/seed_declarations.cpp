/***
 * Name: spindle::compiler::seedDeclarations
 * Purpose: Build the declarations known before any script is read.
 */
#include "compiler/Compiler.h"

#include <vector>

namespace spindle::compiler {

std::vector<sema::Declaration> seedDeclarations(const CompilationJob& job) {
    std::vector<sema::Declaration> known = job.declarations;
    const rt::Library library = job.library ? *job.library : rt::Library::standardLibrary();
    for (const auto& name : library.functionNames()) {
        if (sema::findDeclaration(known, name) != nullptr) { continue; }
        known.push_back(sema::Declaration::function(name, library.get(name)->signature(),
                                                    sema::DeclarationSource::External));
    }
    const rt::FunctionSignature visited{{rt::ValueType::String}, rt::ValueType::Boolean};
    const rt::FunctionSignature visitedCount{{rt::ValueType::String}, rt::ValueType::Number};
    if (sema::findDeclaration(known, rt::Library::kVisitedFunction) == nullptr) {
        known.push_back(sema::Declaration::function(rt::Library::kVisitedFunction, visited,
                                                    sema::DeclarationSource::External));
    }
    if (sema::findDeclaration(known, rt::Library::kVisitedCountFunction) == nullptr) {
        known.push_back(sema::Declaration::function(rt::Library::kVisitedCountFunction, visitedCount,
                                                    sema::DeclarationSource::External));
    }
    return known;
}

} // namespace spindle::compiler
