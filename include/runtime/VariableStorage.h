/***
 * Name: spindle::rt::VariableStorage
 * Purpose: Pluggable store for script variable values.
 * Inputs:
 *   - Variable names (including the leading '$') and Values
 * Outputs:
 *   - Stored Value, if any
 * Theory of Operation:
 *   One instance is shared (std::shared_ptr) by the Dialogue's VM, the
 *   library's visit-tracking functions and the embedder, so implementations
 *   must be safe to call from any of them.
 */
#pragma once

#include <optional>
#include <string>

#include "runtime/Value.h"

namespace spindle::rt {

class VariableStorage {
public:
    virtual ~VariableStorage() = default;

    virtual std::optional<Value> get(const std::string& name) const = 0;
    virtual void set(const std::string& name, Value value) = 0;

    virtual bool contains(const std::string& name) const { return get(name).has_value(); }
    virtual void clear() = 0;
};

} // namespace spindle::rt
