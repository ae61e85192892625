/***
 * Name: spindle::sema::Diagnostic
 * Purpose: Carry a diagnostic message with severity and optional source location.
 * Theory of Operation:
 *   Diagnostics are plain values. Equality is structural so identical reports
 *   from different passes or files collapse to one; operator< gives the
 *   stable order results are emitted in (file, line, col, severity, message).
 */
#pragma once

#include <string>
#include <tuple>

namespace spindle::sema {
    enum class Severity { Error, Warning, Info };

    const char* to_string(Severity s);

    struct Diagnostic {
        Severity severity{Severity::Error};
        std::string message;
        std::string file;
        int line{0};
        int col{0};

        bool isError() const { return severity == Severity::Error; }

        bool operator==(const Diagnostic& o) const {
            return severity == o.severity && message == o.message && file == o.file && line == o.line && col == o.col;
        }
        bool operator!=(const Diagnostic& o) const { return !(*this == o); }
        bool operator<(const Diagnostic& o) const {
            return std::tie(file, line, col, severity, message) < std::tie(o.file, o.line, o.col, o.severity, o.message);
        }
    };
} // namespace spindle::sema
