/***
 * Name: spindle::dialogue::ReadOnlyDialogue (impl)
 * Purpose: Program and node queries over state shared with a Dialogue; default loggers.
 */
#include "dialogue/ReadOnlyDialogue.h"

#include <iostream>
#include <mutex>

#include "vm/Events.h"

namespace spindle::dialogue {

Logger defaultErrorLogger() {
  return [](const std::string& message) { std::cerr << "spindle: " << message << '\n'; };
}

void ReadOnlyDialogue::logError(const std::string& message) const {
  if (state_->logError) { state_->logError(message); }
}

std::optional<std::vector<std::string>> ReadOnlyDialogue::nodeNames() const {
  std::shared_lock lock(state_->mutex);
  if (!state_->program) { return std::nullopt; }
  return state_->program->nodeNames();
}

bool ReadOnlyDialogue::nodeExists(const std::string& nodeName) const {
  std::shared_ptr<const ir::Program> program;
  {
    std::shared_lock lock(state_->mutex);
    program = state_->program;
  }
  if (!program) {
    logError("tried to check whether node '" + nodeName + "' exists, but no program has been loaded");
    return false;
  }
  return program->findNode(nodeName) != nullptr;
}

std::optional<ir::Node> ReadOnlyDialogue::findNodeLoggingErrors(const std::string& nodeName) const {
  std::shared_ptr<const ir::Program> program;
  {
    std::shared_lock lock(state_->mutex);
    program = state_->program;
  }
  if (!program) {
    logError("no program is loaded");
    return std::nullopt;
  }
  if (program->nodes.empty()) {
    logError("no nodes are loaded");
    return std::nullopt;
  }
  const ir::Node* node = program->findNode(nodeName);
  if (node == nullptr) {
    logError("no node named '" + nodeName + "'");
    return std::nullopt;
  }
  return *node;
}

std::optional<std::vector<std::string>> ReadOnlyDialogue::getTagsForNode(const std::string& nodeName) const {
  auto node = findNodeLoggingErrors(nodeName);
  if (!node) { return std::nullopt; }
  return node->tags;
}

std::optional<std::string> ReadOnlyDialogue::getStringIdForNode(const std::string& nodeName) const {
  auto node = findNodeLoggingErrors(nodeName);
  if (!node) { return std::nullopt; }
  if (node->sourceTextStringId) { return node->sourceTextStringId; }
  return "line:" + nodeName;
}

std::optional<std::string> ReadOnlyDialogue::currentNode() const {
  std::shared_lock lock(state_->mutex);
  return state_->currentNode;
}

std::optional<std::string> ReadOnlyDialogue::languageCode() const {
  std::shared_lock lock(state_->mutex);
  return state_->languageCode;
}

std::string ReadOnlyDialogue::expandSubstitutions(const std::string& text,
                                                  const std::vector<std::string>& substitutions) {
  return vm::expandSubstitutions(text, substitutions);
}

} // namespace spindle::dialogue
