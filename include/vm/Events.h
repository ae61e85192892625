/***
 * Name: spindle::vm events
 * Purpose: Data the virtual machine hands to embedder callbacks.
 * Theory of Operation:
 *   Every payload is a plain value; handlers receive const references and
 *   cannot reach back into the machine.
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace spindle::vm {

// A line to show: its id in the string table plus substitution values,
// already converted to text.
struct Line {
    std::string id;
    std::vector<std::string> substitutions{};

    bool operator==(const Line& o) const { return id == o.id && substitutions == o.substitutions; }
};

using OptionId = std::size_t;

struct DialogueOption {
    Line line;
    OptionId id{0};
    std::string destinationLabel; // label inside the current node
    bool isAvailable{true};       // false when its <<if>> condition failed

    bool operator==(const DialogueOption& o) const {
        return line == o.line && id == o.id && destinationLabel == o.destinationLabel && isAvailable == o.isAvailable;
    }
};

struct Command {
    std::string text; // substitutions already expanded
};

using LineHandler = std::function<void(const Line&)>;
using OptionsHandler = std::function<void(const std::vector<DialogueOption>&)>;
using CommandHandler = std::function<void(const Command&)>;
using NodeStartHandler = std::function<void(const std::string&)>;
using NodeCompleteHandler = std::function<void(const std::string&)>;
using DialogueCompleteHandler = std::function<void()>;
using PrepareForLinesHandler = std::function<void(const std::vector<std::string>&)>;

struct Handlers {
    LineHandler line{};
    OptionsHandler options{};
    CommandHandler command{};
    NodeStartHandler nodeStart{};
    NodeCompleteHandler nodeComplete{};
    DialogueCompleteHandler dialogueComplete{};
    PrepareForLinesHandler prepareForLines{};
};

// Replaces each `{i}` marker in `text` with substitutions[i]; markers with
// no matching substitution are left as written.
std::string expandSubstitutions(const std::string& text, const std::vector<std::string>& substitutions);

} // namespace spindle::vm
