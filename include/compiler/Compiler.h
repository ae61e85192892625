#ifndef SPINDLE_COMPILER_COMPILER_H
#define SPINDLE_COMPILER_COMPILER_H

/***
 * Name: spindle::compiler
 * Purpose: Compile dialogue scripts into an ir::Program.
 * Inputs:
 *   - CompilationJob: ordered (name, source) files, optional Library used for
 *     function signatures, compilation mode, optional seed declarations
 * Outputs:
 *   - CompilationResult: Program (absent on errors or by mode), sorted and
 *     deduplicated diagnostics, string table, declarations, debug info, file
 *     tags
 * Theory of Operation:
 *   compile() folds a CompilationState through seven passes in order:
 *     1. register_strings           parse, tag last lines, build string table
 *     2. get_declarations           collect <<declare>>, file tags
 *     3. check_types                type check; re-check files with deferred uses
 *     4. find_tracking_nodes        visited()/visited_count() and tracking headers
 *     5. add_tracking_declarations  hidden visit counters
 *     6. generate_code              one Program per file, then combine
 *     7. add_initial_value_registrations
 *   The mode selects which passes run; pass 7 always runs. Diagnostics never
 *   stop the fold, but any Error before pass 6 skips code generation.
 */

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "codegen/Codegen.h"
#include "compiler/StringInfo.h"
#include "ir/Program.h"
#include "runtime/Library.h"
#include "sema/Declaration.h"
#include "sema/Diagnostic.h"

namespace spindle { namespace obs { class Metrics; } }

namespace spindle::compiler {

enum class CompilationType {
    FullCompilation,  // every pass
    TypeCheck,        // passes 1-5 and 7; no Program
    DeclarationsOnly, // passes 1-2 and 7
    StringsOnly       // pass 1 and 7
};

struct File {
    std::string fileName;
    std::string source;
};

struct CompilationJob {
    std::vector<File> files{};
    // Functions scripts may call; the standard library when absent.
    std::optional<rt::Library> library{};
    CompilationType compilationType{CompilationType::FullCompilation};
    std::vector<sema::Declaration> declarations{};

    CompilationJob& addFile(std::string fileName, std::string source) {
        files.push_back(File{std::move(fileName), std::move(source)});
        return *this;
    }

    // Single file named "<input>".
    static CompilationJob fromSource(std::string source) {
        CompilationJob job;
        job.addFile("<input>", std::move(source));
        return job;
    }
};

struct CompilationResult {
    std::optional<ir::Program> program{};
    StringTable stringTable{};
    std::vector<sema::Declaration> declarations{};
    bool containsImplicitStringTags{false};
    std::map<std::string, std::vector<std::string>> fileTags{};
    std::vector<sema::Diagnostic> diagnostics{};
    std::map<std::string, codegen::DebugInfo> debugInfo{};

    bool hasErrors() const;
};

CompilationResult compile(const CompilationJob& job, obs::Metrics* metrics = nullptr);

// Declarations every compilation starts from: the job's seeds, one per
// library function and the visit-tracking built-ins.
std::vector<sema::Declaration> seedDeclarations(const CompilationJob& job);

// `file:line:col: severity: message`, then the source line and a caret when
// `source` (or the file on disk) has that line.
std::string formatDiagnostic(const sema::Diagnostic& diag, bool color, const std::string* source = nullptr);

// Writes formatDiagnostic() to stderr.
void printDiagnostic(const sema::Diagnostic& diag, bool color, const std::string* source = nullptr);

// True when SPINDLE_COLOR is 1, true or yes (any case).
bool useEnvColor();

} // namespace spindle::compiler

#endif // SPINDLE_COMPILER_COMPILER_H
