/***
 * Name: spindle::dialogue::Dialogue (impl)
 * Purpose: Wire storage, library, handlers and programs into one running VM.
 */
#include "dialogue/Dialogue.h"

#include <mutex>
#include <utility>

#include "runtime/MemoryVariableStorage.h"

namespace spindle::dialogue {

Dialogue::Dialogue() : Dialogue(std::make_shared<rt::MemoryVariableStorage>()) {}

Dialogue::Dialogue(std::shared_ptr<rt::VariableStorage> storage)
    : storage_(std::move(storage)),
      library_(std::make_shared<rt::Library>(rt::Library::standardLibrary())),
      state_(std::make_shared<DialogueState>()),
      vm_(library_, storage_) {
  library_->addVisitTracking(storage_);
  state_->logError = defaultErrorLogger();
  setNodeStartHandler(nullptr);
}

Dialogue& Dialogue::setLineHandler(vm::LineHandler handler) {
  vm_.handlers().line = std::move(handler);
  return *this;
}

Dialogue& Dialogue::setOptionsHandler(vm::OptionsHandler handler) {
  vm_.handlers().options = std::move(handler);
  return *this;
}

Dialogue& Dialogue::setCommandHandler(vm::CommandHandler handler) {
  vm_.handlers().command = std::move(handler);
  return *this;
}

// The read-only view follows the VM through node starts, including jumps.
Dialogue& Dialogue::setNodeStartHandler(vm::NodeStartHandler handler) {
  vm_.handlers().nodeStart = [state = state_, handler = std::move(handler)](const std::string& name) {
    {
      std::unique_lock lock(state->mutex);
      state->currentNode = name;
    }
    if (handler) { handler(name); }
  };
  return *this;
}

Dialogue& Dialogue::setNodeCompleteHandler(vm::NodeCompleteHandler handler) {
  vm_.handlers().nodeComplete = std::move(handler);
  return *this;
}

Dialogue& Dialogue::setDialogueCompleteHandler(vm::DialogueCompleteHandler handler) {
  vm_.handlers().dialogueComplete = std::move(handler);
  return *this;
}

Dialogue& Dialogue::setPrepareForLinesHandler(vm::PrepareForLinesHandler handler) {
  vm_.handlers().prepareForLines = std::move(handler);
  return *this;
}

Dialogue& Dialogue::setLogDebugMessage(Logger logger) {
  std::unique_lock lock(state_->mutex);
  state_->logDebug = std::move(logger);
  return *this;
}

Dialogue& Dialogue::setLogErrorMessage(Logger logger) {
  std::unique_lock lock(state_->mutex);
  state_->logError = std::move(logger);
  return *this;
}

Dialogue& Dialogue::setLanguageCode(std::string code) {
  std::unique_lock lock(state_->mutex);
  state_->languageCode = std::move(code);
  return *this;
}

void Dialogue::logDebug(const std::string& message) const {
  if (state_->logDebug) { state_->logDebug(message); }
}

void Dialogue::publishProgram(std::shared_ptr<const ir::Program> program) {
  {
    std::unique_lock lock(state_->mutex);
    state_->program = program;
    state_->currentNode.reset();
  }
  vm_.setProgram(std::move(program));
}

Dialogue& Dialogue::setProgram(ir::Program program) {
  logDebug("loading program with " + std::to_string(program.nodes.size()) + " node(s)");
  publishProgram(std::make_shared<const ir::Program>(std::move(program)));
  return *this;
}

Dialogue& Dialogue::addProgram(const ir::Program& program) {
  if (!vm_.program()) { return setProgram(program); }
  ir::Program merged = *vm_.program();
  merged.merge(program);
  logDebug("added " + std::to_string(program.nodes.size()) + " node(s) to the loaded program");
  publishProgram(std::make_shared<const ir::Program>(std::move(merged)));
  return *this;
}

void Dialogue::setNode(const std::string& nodeName) {
  logDebug("running node '" + nodeName + "'");
  vm_.setNode(nodeName);
}

void Dialogue::continueDialogue() { vm_.continueDialogue(); }

void Dialogue::setSelectedOption(const vm::OptionId id) { vm_.setSelectedOption(id); }

void Dialogue::stop() { vm_.stop(); }

} // namespace spindle::dialogue
