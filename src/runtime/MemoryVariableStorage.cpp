/***
 * Name: spindle::rt::MemoryVariableStorage (impl)
 * Purpose: Map-backed storage guarded by a reader/writer lock.
 */
#include "runtime/MemoryVariableStorage.h"

#include <mutex>
#include <utility>

namespace spindle::rt {

std::optional<Value> MemoryVariableStorage::get(const std::string& name) const {
  std::shared_lock lock(mutex_);
  const auto it = values_.find(name);
  if (it == values_.end()) { return std::nullopt; }
  return it->second;
}

void MemoryVariableStorage::set(const std::string& name, Value value) {
  std::unique_lock lock(mutex_);
  values_[name] = std::move(value);
}

bool MemoryVariableStorage::contains(const std::string& name) const {
  std::shared_lock lock(mutex_);
  return values_.find(name) != values_.end();
}

void MemoryVariableStorage::clear() {
  std::unique_lock lock(mutex_);
  values_.clear();
}

std::size_t MemoryVariableStorage::size() const {
  std::shared_lock lock(mutex_);
  return values_.size();
}

std::map<std::string, Value> MemoryVariableStorage::snapshot() const {
  std::shared_lock lock(mutex_);
  return values_;
}

} // namespace spindle::rt
