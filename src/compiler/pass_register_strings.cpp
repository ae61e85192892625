/***
 * Name: spindle::compiler::registerStrings
 * Purpose: Pass 1. Parse every file, tag last lines and build the string table.
 */
#include "CompilationState.h"
#include "lexer/SourceText.h"
#include "parser/Parser.h"
#include "sema/LastLineTagger.h"
#include "sema/StringTableGenerator.h"

#include <memory>
#include <utility>

namespace spindle::compiler {

CompilationState registerStrings(CompilationState state) {
    for (const auto& file : state.job->files) {
        lex::SourceText input(file.source, file.fileName);
        parse::Parser parser(input);
        std::shared_ptr<ast::File> tree = parser.parseFile();
        state.diagnostics.insert(state.diagnostics.end(), parser.diagnostics().begin(), parser.diagnostics().end());

        // Tags must be in place before the string table copies them.
        sema::tagLastLines(*tree);

        sema::StringTableGenerator strings(state.stringTable, state.diagnostics);
        strings.generate(*tree);
        state.containsImplicitStringTags = state.containsImplicitStringTags || strings.containsImplicitStringTags();

        state.parsedFiles.push_back(ParsedFile{file.fileName, std::move(tree)});
    }
    return state;
}

} // namespace spindle::compiler
