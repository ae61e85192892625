/***
 * Name: spindle::ir::Program
 * Purpose: The compiled artifact: named nodes plus variable initial values.
 * Inputs:
 *   - Nodes and initial values from codegen; other Programs to merge
 * Outputs:
 *   - Node lookup, static line id scans, merged Programs
 * Theory of Operation:
 *   Both maps are ordered so two Programs built from the same source compare
 *   and print identically. merge() validates the whole incoming Program
 *   before changing anything: a shared node name, or a variable whose
 *   initial values differ, throws ProgramConflictError and leaves the
 *   receiver untouched.
 */
#pragma once

#include <map>
#include <string>
#include <vector>

#include "ir/Node.h"
#include "runtime/Value.h"

namespace spindle::ir {

struct Program {
    std::map<std::string, Node> nodes{};
    std::map<std::string, rt::Value> initialValues{};

    void merge(const Program& other);

    // Left fold of merge() over `programs`.
    static Program combine(const std::vector<Program>& programs);

    const Node* findNode(const std::string& name) const;
    std::vector<std::string> nodeNames() const;

    // Every line id the node can deliver (lines and options), in instruction order.
    std::vector<std::string> lineIdsForNode(const std::string& name) const;

    bool operator==(const Program& other) const {
        return nodes == other.nodes && initialValues == other.initialValues;
    }
};

} // namespace spindle::ir
