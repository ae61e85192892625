/***
 * Name: spindle::compiler::useEnvColor
 * Purpose: Decide whether printed diagnostics carry ANSI colors.
 * Inputs:
 *   - SPINDLE_COLOR: "1", "true", "yes" or "on" (any case) enables color.
 *   - NO_COLOR: when set and non-empty, disables color regardless.
 * Outputs:
 *   - true when diagnostics should be colored.
 */
#include "compiler/Compiler.h"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <string>

namespace spindle::compiler {
    namespace {
        constexpr std::array<const char*, 4> kEnabledSpellings{"1", "true", "yes", "on"};

        std::string envLower(const char* name) {
            const char* raw = std::getenv(name);
            std::string out = raw == nullptr ? std::string{} : std::string{raw};
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
            return out;
        }
    } // namespace

    bool useEnvColor() {
        if (!envLower("NO_COLOR").empty()) { return false; }
        const std::string flag = envLower("SPINDLE_COLOR");
        return std::any_of(kEnabledSpellings.begin(), kEnabledSpellings.end(),
                           [&flag](const char* spelling) { return flag == spelling; });
    }
} // namespace spindle::compiler
