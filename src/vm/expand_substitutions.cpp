/***
 * Name: spindle::vm::expandSubstitutions
 * Purpose: Replace "{i}" markers with the i-th substitution; markers without one stay.
 */
#include "vm/Events.h"

#include <string>
#include <vector>

namespace spindle::vm {

std::string expandSubstitutions(const std::string& text, const std::vector<std::string>& substitutions) {
    std::string out = text;
    for (std::size_t i = 0; i < substitutions.size(); ++i) {
        const std::string marker = "{" + std::to_string(i) + "}";
        std::size_t pos = 0;
        while ((pos = out.find(marker, pos)) != std::string::npos) {
            out.replace(pos, marker.size(), substitutions[i]);
            pos += substitutions[i].size();
        }
    }
    return out;
}

} // namespace spindle::vm
