/***
 * Name: spindle::vm::VirtualMachine (impl)
 * Purpose: Instruction dispatch and execution state transitions.
 */
#include "vm/VirtualMachine.h"

#include <utility>

#include "ir/Opcode.h"
#include "observability/Metrics.h"
#include "spindle/exceptions/dialogue_state_error.h"
#include "spindle/exceptions/invalid_option_error.h"
#include "spindle/exceptions/unknown_node_error.h"

namespace spindle::vm {

using exceptions::DialogueStateError;
using ir::Opcode;

namespace {
const std::string kNoNode{};
} // namespace

const char* to_string(const ExecutionState state) {
  switch (state) {
    case ExecutionState::Stopped: return "Stopped";
    case ExecutionState::WaitingOnOptionSelection: return "WaitingOnOptionSelection";
    case ExecutionState::WaitingForContinue: return "WaitingForContinue";
    case ExecutionState::Running: return "Running";
  }
  return "?";
}

VirtualMachine::VirtualMachine(std::shared_ptr<const rt::Library> library, std::shared_ptr<rt::VariableStorage> storage)
    : library_(std::move(library)), storage_(std::move(storage)) {}

void VirtualMachine::setProgram(std::shared_ptr<const ir::Program> program) {
  program_ = std::move(program);
  resetState();
}

void VirtualMachine::resetState() {
  state_ = ExecutionState::Stopped;
  node_ = nullptr;
  pc_ = 0;
  stack_.clear();
  pendingOptions_.clear();
  presentedOptions_.clear();
}

const std::string& VirtualMachine::currentNodeName() const { return node_ != nullptr ? node_->name : kNoNode; }

void VirtualMachine::setNode(const std::string& name) {
  enterNode(name);
  state_ = ExecutionState::WaitingForContinue;
}

// Shared by setNode and RunNode; leaves the execution state alone so a jump
// keeps running.
void VirtualMachine::enterNode(const std::string& name) {
  if (!program_) { throw DialogueStateError("cannot set node '" + name + "': no program is loaded"); }
  const ir::Node* next = program_->findNode(name);
  if (next == nullptr) { throw exceptions::UnknownNodeError("no node named '" + name + "' has been loaded"); }

  node_ = next;
  pc_ = 0;
  stack_.clear();
  pendingOptions_.clear();
  presentedOptions_.clear();

  if (handlers_.nodeStart) { handlers_.nodeStart(name); }
  if (handlers_.prepareForLines) { handlers_.prepareForLines(program_->lineIdsForNode(name)); }
}

void VirtualMachine::completeNode() {
  if (node_ == nullptr) { return; }
  if (node_->tracked) {
    const std::string var = rt::Library::generateUniqueVisitedVariableForNode(node_->name);
    const auto current = storage_->get(var);
    const double count = current && current->isNumber() ? current->asNumber() : 0.0;
    storage_->set(var, rt::Value::Number(count + 1.0));
  }
  if (handlers_.nodeComplete) { handlers_.nodeComplete(node_->name); }
}

void VirtualMachine::finishDialogue() {
  completeNode();
  resetState();
  if (handlers_.dialogueComplete) { handlers_.dialogueComplete(); }
}

void VirtualMachine::stop() {
  resetState();
  if (handlers_.dialogueComplete) { handlers_.dialogueComplete(); }
}

// Handlers run while the state is still Running, which makes a nested
// continueDialogue() from inside one a no-op.
void VirtualMachine::continueDialogue() {
  if (state_ == ExecutionState::Running) { return; }
  if (!program_) { throw DialogueStateError("cannot continue: no program is loaded"); }
  if (node_ == nullptr) { throw DialogueStateError("cannot continue: no node has been selected; call setNode first"); }
  if (state_ == ExecutionState::WaitingOnOptionSelection) {
    throw DialogueStateError("cannot continue: waiting for an option to be selected");
  }

  state_ = ExecutionState::Running;
  try {
    while (state_ == ExecutionState::Running) {
      if (pc_ >= node_->instructions.size()) {
        finishDialogue();
        break;
      }
      const ir::Instruction& instruction = node_->instructions[pc_++];
      if (metrics_ != nullptr) { metrics_->incCounter("vm.instructions"); }
      runInstruction(instruction);
    }
  } catch (...) {
    // A failed instruction leaves no node to resume.
    resetState();
    throw;
  }
}

void VirtualMachine::setSelectedOption(const OptionId id) {
  if (state_ != ExecutionState::WaitingOnOptionSelection) {
    throw exceptions::InvalidOptionError("no option selection is pending (state is " +
                                         std::string(to_string(state_)) + ")");
  }
  for (const auto& option : presentedOptions_) {
    if (option.id != id) { continue; }
    stack_.push_back(rt::Value::String(option.destinationLabel));
    presentedOptions_.clear();
    state_ = ExecutionState::WaitingForContinue;
    return;
  }
  throw exceptions::InvalidOptionError("option " + std::to_string(id) + " is not one of the presented options");
}

void VirtualMachine::jumpToLabel(const std::string& label) {
  auto it = node_->labels.find(label);
  if (it == node_->labels.end()) {
    throw DialogueStateError("unknown label '" + label + "' in node '" + node_->name + "'");
  }
  pc_ = it->second;
}

rt::Value VirtualMachine::pop() {
  if (stack_.empty()) { throw DialogueStateError("stack underflow in node '" + node_->name + "'"); }
  rt::Value top = std::move(stack_.back());
  stack_.pop_back();
  return top;
}

const rt::Value& VirtualMachine::peek() const {
  if (stack_.empty()) { throw DialogueStateError("stack underflow in node '" + node_->name + "'"); }
  return stack_.back();
}

// Substitutions were pushed in order, so the last one is on top.
std::vector<std::string> VirtualMachine::popSubstitutions(const std::size_t count) {
  std::vector<std::string> out(count);
  for (std::size_t i = count; i > 0; --i) { out[i - 1] = pop().toString(); }
  return out;
}

rt::Value VirtualMachine::readVariable(const std::string& name) {
  if (auto value = storage_->get(name)) { return *value; }
  auto it = program_->initialValues.find(name);
  if (it == program_->initialValues.end()) {
    throw DialogueStateError("variable '" + name + "' has no value and no initial value");
  }
  storage_->set(name, it->second);
  return it->second;
}

void VirtualMachine::runInstruction(const ir::Instruction& in) {
  switch (in.opcode) {
    case Opcode::JumpTo:
      jumpToLabel(in.stringOperand(0));
      break;
    case Opcode::Jump:
      jumpToLabel(pop().toString());
      break;
    case Opcode::RunLine: {
      Line line{in.stringOperand(0), popSubstitutions(static_cast<std::size_t>(in.numberOperand(1)))};
      if (handlers_.line) { handlers_.line(line); }
      if (state_ == ExecutionState::Running) { state_ = ExecutionState::WaitingForContinue; }
      break;
    }
    case Opcode::RunCommand: {
      const auto subs = popSubstitutions(static_cast<std::size_t>(in.numberOperand(1)));
      Command command{expandSubstitutions(in.stringOperand(0), subs)};
      if (handlers_.command) { handlers_.command(command); }
      if (state_ == ExecutionState::Running) { state_ = ExecutionState::WaitingForContinue; }
      break;
    }
    case Opcode::AddOption: {
      DialogueOption option;
      option.line = Line{in.stringOperand(0), popSubstitutions(static_cast<std::size_t>(in.numberOperand(2)))};
      option.destinationLabel = in.stringOperand(1);
      option.id = pendingOptions_.size();
      if (in.boolOperand(3)) { option.isAvailable = pop().asBool(); }
      pendingOptions_.push_back(std::move(option));
      break;
    }
    case Opcode::ShowOptions:
      if (pendingOptions_.empty()) {
        // Nothing to offer ends the dialogue.
        finishDialogue();
        break;
      }
      presentedOptions_ = std::move(pendingOptions_);
      pendingOptions_.clear();
      if (handlers_.options) { handlers_.options(presentedOptions_); }
      if (state_ == ExecutionState::Running) { state_ = ExecutionState::WaitingOnOptionSelection; }
      break;
    case Opcode::PushString:
      stack_.push_back(rt::Value::String(in.stringOperand(0)));
      break;
    case Opcode::PushNumber:
      stack_.push_back(rt::Value::Number(in.numberOperand(0)));
      break;
    case Opcode::PushBool:
      stack_.push_back(rt::Value::Boolean(in.boolOperand(0)));
      break;
    case Opcode::JumpIfFalse:
      if (!peek().asBool()) { jumpToLabel(in.stringOperand(0)); }
      break;
    case Opcode::Pop:
      (void) pop();
      break;
    case Opcode::CallFunc: {
      const auto argc = static_cast<std::size_t>(in.numberOperand(1));
      std::vector<rt::Value> args(argc);
      for (std::size_t i = argc; i > 0; --i) { args[i - 1] = pop(); }
      stack_.push_back(library_->call(in.stringOperand(0), args));
      break;
    }
    case Opcode::PushVariable:
      stack_.push_back(readVariable(in.stringOperand(0)));
      break;
    case Opcode::StoreVariable:
      storage_->set(in.stringOperand(0), peek());
      break;
    case Opcode::Stop:
      finishDialogue();
      break;
    case Opcode::RunNode: {
      const std::string target = pop().toString();
      completeNode();
      enterNode(target);
      break;
    }
  }
}

} // namespace spindle::vm
