/***
 * Name: spindle::dialogue::Dialogue
 * Purpose: Embedder entry point composing Library, VariableStorage and VM.
 * Inputs:
 *   - Compiled Programs, handlers, loggers, option selections
 *   - VariableStorage shared with the caller (a MemoryVariableStorage when
 *     none is given)
 * Outputs:
 *   - Handler invocations driven by continueDialogue()
 * Theory of Operation:
 *   The Library starts as the standard library plus visited() and
 *   visited_count(), both reading the same VariableStorage the VM writes
 *   visit counters to. Programs are held through shared_ptr<const> so the
 *   read-only view can hand out node data while the VM runs.
 *
 *   Calls on one Dialogue must not overlap; ReadOnlyDialogue copies may be
 *   used from any thread.
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "dialogue/ReadOnlyDialogue.h"
#include "ir/Program.h"
#include "runtime/Library.h"
#include "runtime/VariableStorage.h"
#include "vm/Events.h"
#include "vm/VirtualMachine.h"

namespace spindle::dialogue {

class Dialogue {
 public:
  static constexpr const char* kDefaultStartNodeName = "Start";

  Dialogue();
  explicit Dialogue(std::shared_ptr<rt::VariableStorage> storage);

  Dialogue(const Dialogue&) = delete;
  Dialogue& operator=(const Dialogue&) = delete;

  // Functions scripts may call. Register additions before running; the VM
  // reads the live registry.
  rt::Library& library() { return *library_; }
  const rt::Library& library() const { return *library_; }

  const std::shared_ptr<rt::VariableStorage>& variableStorage() const { return storage_; }

  Dialogue& setLineHandler(vm::LineHandler handler);
  Dialogue& setOptionsHandler(vm::OptionsHandler handler);
  Dialogue& setCommandHandler(vm::CommandHandler handler);
  Dialogue& setNodeStartHandler(vm::NodeStartHandler handler);
  Dialogue& setNodeCompleteHandler(vm::NodeCompleteHandler handler);
  Dialogue& setDialogueCompleteHandler(vm::DialogueCompleteHandler handler);
  Dialogue& setPrepareForLinesHandler(vm::PrepareForLinesHandler handler);

  Dialogue& setLogDebugMessage(Logger logger);
  Dialogue& setLogErrorMessage(Logger logger);
  Dialogue& setLanguageCode(std::string code);

  // Replaces the loaded program and stops the VM.
  Dialogue& setProgram(ir::Program program);
  // Merges into the loaded program (throws ProgramConflictError on a shared
  // node name); loads it when there is none.
  Dialogue& addProgram(const ir::Program& program);

  void setNode(const std::string& nodeName);
  void setStartNode() { setNode(kDefaultStartNodeName); }
  void continueDialogue();
  void setSelectedOption(vm::OptionId id);
  void stop();

  bool isActive() const { return vm_.executionState() != vm::ExecutionState::Stopped; }
  vm::ExecutionState executionState() const { return vm_.executionState(); }

  ReadOnlyDialogue readOnly() const { return ReadOnlyDialogue(state_); }

  std::optional<std::vector<std::string>> nodeNames() const { return readOnly().nodeNames(); }
  bool nodeExists(const std::string& nodeName) const { return readOnly().nodeExists(nodeName); }
  std::optional<std::vector<std::string>> getTagsForNode(const std::string& nodeName) const {
    return readOnly().getTagsForNode(nodeName);
  }
  std::optional<std::string> getStringIdForNode(const std::string& nodeName) const {
    return readOnly().getStringIdForNode(nodeName);
  }
  std::optional<std::string> currentNode() const { return readOnly().currentNode(); }

  // Counts executed instructions into `metrics`; pass nullptr to stop.
  void setMetrics(obs::Metrics* metrics) { vm_.setMetrics(metrics); }

 private:
  void publishProgram(std::shared_ptr<const ir::Program> program);
  void logDebug(const std::string& message) const;

  std::shared_ptr<rt::VariableStorage> storage_;
  std::shared_ptr<rt::Library> library_;
  std::shared_ptr<DialogueState> state_;
  vm::VirtualMachine vm_;
};

} // namespace spindle::dialogue
