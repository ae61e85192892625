/***
 * Name: spindle::rt::MemoryVariableStorage
 * Purpose: Default in-memory, thread-safe VariableStorage.
 */
#pragma once

#include <cstddef>
#include <map>
#include <shared_mutex>
#include <string>

#include "runtime/VariableStorage.h"

namespace spindle::rt {

class MemoryVariableStorage final : public VariableStorage {
public:
    std::optional<Value> get(const std::string& name) const override;
    void set(const std::string& name, Value value) override;
    bool contains(const std::string& name) const override;
    void clear() override;

    std::size_t size() const;
    // Copy of every stored variable, ordered by name.
    std::map<std::string, Value> snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, Value> values_;
};

} // namespace spindle::rt
