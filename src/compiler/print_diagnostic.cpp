#include "compiler/Compiler.h"
#include "lexer/SourceText.h"

#include <unistd.h>

#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

namespace spindle::compiler {
    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kYellow = "\033[33m";
    static constexpr std::string_view kCyan = "\033[36m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static std::string_view severity_color(const sema::Severity severity) {
        switch (severity) {
            case sema::Severity::Error: return kRed;
            case sema::Severity::Warning: return kYellow;
            case sema::Severity::Info:
            default: return kCyan;
        }
    }

    static void append_header(std::ostringstream &out, const sema::Diagnostic &diag, const bool color) {
        if (diag.file.empty()) { return; }
        if (color) { out << kBold; }
        out << diag.file << ":" << diag.line << ":" << diag.col << ": ";
        if (color) { out << kReset; }
    }

    static void append_label(std::ostringstream &out, const sema::Severity severity, const bool color) {
        if (color) { out << severity_color(severity); }
        out << sema::to_string(severity) << ": ";
        if (color) { out << kReset; }
    }

    static bool find_line(std::istream &input, const int line, std::string &lineStr) {
        int curLine = 1;
        while (curLine < line && std::getline(input, lineStr)) { ++curLine; }
        if (curLine != line || !std::getline(input, lineStr)) { return false; }
        if (!lineStr.empty() && lineStr.back() == '\r') { lineStr.pop_back(); }
        return true;
    }

    static void append_source_with_caret(std::ostringstream &out, const sema::Diagnostic &diag,
                                         const std::string *source) {
        if (diag.line <= 0 || diag.col <= 0) { return; }
        std::string lineStr;
        if (source != nullptr) {
            const auto found = lex::SourceText(*source, diag.file).lineAt(diag.line);
            if (!found) { return; }
            lineStr = *found;
        } else {
            if (diag.file.empty()) { return; }
            std::ifstream input(diag.file);
            if (!input || !find_line(input, diag.line, lineStr)) { return; }
        }
        out << "  " << lineStr << "\n  ";
        for (int i = 1; i < diag.col; ++i) { out << " "; }
        out << "^\n";
    }

    std::string formatDiagnostic(const sema::Diagnostic &diag, const bool color, const std::string *source) {
        std::ostringstream out;
        append_header(out, diag, color);
        append_label(out, diag.severity, color);
        out << diag.message << "\n";
        append_source_with_caret(out, diag, source);
        return out.str();
    }

    void printDiagnostic(const sema::Diagnostic &diag, const bool color, const std::string *source) {
        const std::string text = formatDiagnostic(diag, color, source);
        std::size_t written = 0;
        while (written < text.size()) {
            const auto n = ::write(2, text.data() + written, text.size() - written);
            if (n <= 0) { return; }
            written += static_cast<std::size_t>(n);
        }
    }
} // namespace spindle::compiler
