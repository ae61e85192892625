/***
 * Name: spindle::rt::NativeFunction
 * Purpose: Wrap a native callable of any arity as an rt::Function.
 * Inputs:
 *   - std::function<R(Args...)> with R/Args among double, float, int, bool, std::string;
 *     an rt::Value parameter receives the argument unconverted
 * Outputs:
 *   - Function whose signature is derived from the C++ types at registration
 * Theory of Operation:
 *   ValueConverter<T> maps each supported C++ type to a ValueType and converts
 *   in both directions. call() checks the argument count, converts every
 *   argument (reporting the first unconvertible one) and only then unpacks the
 *   tuple into the native callable.
 */
#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "runtime/Function.h"
#include "spindle/exceptions/value_conversion_error.h"

namespace spindle::rt {

namespace detail {

template <typename T>
struct ValueConverter;

template <>
struct ValueConverter<double> {
    static constexpr ValueType kType = ValueType::Number;
    static double fromValue(const Value& v) { return v.asNumber(); }
    static Value toValue(double v) { return Value::Number(v); }
};

template <>
struct ValueConverter<float> {
    static constexpr ValueType kType = ValueType::Number;
    static float fromValue(const Value& v) {
        const double n = v.asNumber();
        if (std::isfinite(n) && std::fabs(n) > static_cast<double>(std::numeric_limits<float>::max())) {
            throw exceptions::ValueConversionError("number " + v.toString() + " is outside the float range");
        }
        return static_cast<float>(n);
    }
    static Value toValue(float v) { return Value::Number(static_cast<double>(v)); }
};

template <>
struct ValueConverter<int> {
    static constexpr ValueType kType = ValueType::Number;
    static int fromValue(const Value& v) {
        const double n = v.asNumber();
        if (!std::isfinite(n) || n < static_cast<double>(std::numeric_limits<int>::min()) ||
            n > static_cast<double>(std::numeric_limits<int>::max())) {
            throw exceptions::ValueConversionError("number " + v.toString() + " is outside the int range");
        }
        return static_cast<int>(n);
    }
    static Value toValue(int v) { return Value::Number(static_cast<double>(v)); }
};

// Parameters only: the callable sees the argument as passed.
template <>
struct ValueConverter<Value> {
    static Value fromValue(const Value& v) { return v; }
};

template <typename T>
constexpr std::optional<ValueType> parameterKind() {
    if constexpr (std::is_same_v<T, Value>) {
        return std::nullopt;
    } else {
        return ValueConverter<T>::kType;
    }
}

template <>
struct ValueConverter<bool> {
    static constexpr ValueType kType = ValueType::Boolean;
    static bool fromValue(const Value& v) { return v.asBool(); }
    static Value toValue(bool v) { return Value::Boolean(v); }
};

template <>
struct ValueConverter<std::string> {
    static constexpr ValueType kType = ValueType::String;
    static std::string fromValue(const Value& v) { return v.asString(); }
    static Value toValue(const std::string& v) { return Value::String(v); }
};

[[noreturn]] void throwArityMismatch(const std::string& name, std::size_t expected, std::size_t got);
[[noreturn]] void throwArgumentType(const std::string& name, std::size_t index, ValueType expected,
                                    const Value& got, const char* reason);

template <typename T>
T convertArgument(const std::string& name, const std::vector<Value>& args, std::size_t index) {
    if constexpr (std::is_same_v<T, Value>) {
        return args[index];
    } else {
        try {
            return ValueConverter<T>::fromValue(args[index]);
        } catch (const exceptions::ValueConversionError& ex) {
            throwArgumentType(name, index, ValueConverter<T>::kType, args[index], ex.what());
        }
    }
}

} // namespace detail

template <typename R, typename... Args>
class NativeFunction final : public Function {
public:
    using FuncType = std::function<R(Args...)>;

    NativeFunction(std::string name, FuncType fn)
        : name_(std::move(name)), fn_(std::move(fn)),
          sig_{{detail::parameterKind<std::decay_t<Args>>()...}, detail::ValueConverter<std::decay_t<R>>::kType} {}

    const FunctionSignature& signature() const override { return sig_; }

    Value call(const std::vector<Value>& args) const override {
        if (args.size() != sizeof...(Args)) {
            detail::throwArityMismatch(name_, sizeof...(Args), args.size());
        }
        return invoke(args, std::index_sequence_for<Args...>{});
    }

private:
    template <std::size_t... Is>
    Value invoke([[maybe_unused]] const std::vector<Value>& args, std::index_sequence<Is...>) const {
        // Braced init keeps left-to-right conversion order, so the first bad argument is reported.
        std::tuple<std::decay_t<Args>...> unpacked{detail::convertArgument<std::decay_t<Args>>(name_, args, Is)...};
        return detail::ValueConverter<std::decay_t<R>>::toValue(std::apply(fn_, std::move(unpacked)));
    }

    std::string name_;
    FuncType fn_;
    FunctionSignature sig_;
};

} // namespace spindle::rt
