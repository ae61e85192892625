/***
 * Name: spindle::dialogue::ReadOnlyDialogue
 * Purpose: The part of a Dialogue that handlers may safely use.
 * Inputs:
 *   - Shared state published by the owning Dialogue
 * Outputs:
 *   - Node names, node tags, raw-text string ids, current node, language code
 * Theory of Operation:
 *   Copies share one DialogueState with the Dialogue that created them, so
 *   a copy captured in a handler sees program and node changes. Reads take a
 *   shared lock; only the Dialogue writes. Lookups that fail report through
 *   the error logger and return an empty optional.
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "ir/Program.h"

namespace spindle::dialogue {

// Receives one log message.
using Logger = std::function<void(const std::string&)>;

// Writes "spindle: <message>" to stderr.
Logger defaultErrorLogger();

struct DialogueState {
  mutable std::shared_mutex mutex{};
  std::shared_ptr<const ir::Program> program{};
  std::optional<std::string> currentNode{};
  std::optional<std::string> languageCode{};
  Logger logDebug{};
  Logger logError{};
};

class ReadOnlyDialogue {
 public:
  explicit ReadOnlyDialogue(std::shared_ptr<const DialogueState> state) : state_(std::move(state)) {}

  // Absent when no program is loaded.
  std::optional<std::vector<std::string>> nodeNames() const;

  bool nodeExists(const std::string& nodeName) const;

  std::optional<std::vector<std::string>> getTagsForNode(const std::string& nodeName) const;

  // Id under which a `rawText` node's source is stored in the string table.
  // Whether the table has that entry is not checked.
  std::optional<std::string> getStringIdForNode(const std::string& nodeName) const;

  // Node most recently started; absent before the first setNode.
  std::optional<std::string> currentNode() const;

  std::optional<std::string> languageCode() const;

  static std::string expandSubstitutions(const std::string& text, const std::vector<std::string>& substitutions);

 private:
  std::optional<ir::Node> findNodeLoggingErrors(const std::string& nodeName) const;
  void logError(const std::string& message) const;

  std::shared_ptr<const DialogueState> state_;
};

} // namespace spindle::dialogue
