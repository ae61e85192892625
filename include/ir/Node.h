/***
 * Name: spindle::ir::Node
 * Purpose: Compiled form of one dialogue node.
 * Inputs:
 *   - Produced by codegen::Codegen
 * Outputs:
 *   - Instruction stream and label table consumed by vm::VirtualMachine
 */
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ir/Instruction.h"

namespace spindle::ir {

struct Node {
    std::string name{};
    std::vector<Instruction> instructions{};
    std::map<std::string, std::size_t> labels{};
    std::vector<std::string> tags{};
    // Header lines other than title/tags, in source order.
    std::vector<std::pair<std::string, std::string>> headers{};
    bool tracked{false};
    // Set for nodes tagged rawText: string table id holding the body source.
    std::optional<std::string> sourceTextStringId{};

    bool operator==(const Node& other) const {
        return name == other.name && instructions == other.instructions && labels == other.labels &&
               tags == other.tags && headers == other.headers && tracked == other.tracked &&
               sourceTextStringId == other.sourceTextStringId;
    }
};

} // namespace spindle::ir
