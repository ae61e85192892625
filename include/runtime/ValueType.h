/**
 * Name: spindle::rt::ValueType
 * Purpose: Kinds a runtime Value can hold.
 */
#pragma once

namespace spindle::rt {

enum class ValueType {
    String,
    Number,
    Boolean
};

// Script-facing name used for operator function prefixes ("Number.Add") and diagnostics.
const char* to_string(ValueType t);

} // namespace spindle::rt
