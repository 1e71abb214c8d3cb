// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <any>
#include <functional>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace callguard {

/// Heterogeneous argument or result value.
using Value = std::any;

struct Arguments;

/// Plain callback: receives the caller's arguments, returns an arbitrary value.
using Callback = std::function<Value(const Arguments&)>;

class GuardedProxy;

/**
 * @brief Positional and keyword arguments of one call.
 */
struct Arguments {
    std::vector<Value> positional;
    std::map<std::string, Value> keywords;

    /**
     * @brief Build positional arguments from plain values.
     *
     * String literals are stored as std::string, callables taking
     * `const Arguments&` are stored as Callback (void results become an
     * empty Value).
     */
    template <typename... Ts>
    static Arguments of(Ts&&... values);

    /// Add or replace a keyword argument.
    template <typename T>
    Arguments& with(std::string name, T&& value) &;

    template <typename T>
    Arguments&& with(std::string name, T&& value) &&;

    [[nodiscard]] bool empty() const { return positional.empty() && keywords.empty(); }
};

namespace detail {

template <typename T>
struct is_guarded_proxy : std::is_same<std::decay_t<T>, GuardedProxy> {};

} // namespace detail

/**
 * @brief Convert a C++ value into the Value stored in Arguments.
 */
template <typename T>
Value to_value(T&& value) {
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, Value>) {
        return std::forward<T>(value);
    } else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>) {
        return std::string(value);
    } else if constexpr (detail::is_guarded_proxy<D>::value || std::is_same_v<D, Callback>) {
        return Value(std::forward<T>(value));
    } else if constexpr (std::is_invocable_v<D&, const Arguments&>) {
        if constexpr (std::is_void_v<std::invoke_result_t<D&, const Arguments&>>) {
            return Value(Callback([fn = D(std::forward<T>(value))](const Arguments& args) mutable {
                fn(args);
                return Value{};
            }));
        } else {
            return Value(Callback(std::forward<T>(value)));
        }
    } else {
        return Value(std::forward<T>(value));
    }
}

template <typename... Ts>
Arguments Arguments::of(Ts&&... values) {
    Arguments args;
    args.positional.reserve(sizeof...(Ts));
    (args.positional.push_back(to_value(std::forward<Ts>(values))), ...);
    return args;
}

template <typename T>
Arguments& Arguments::with(std::string name, T&& value) & {
    keywords[std::move(name)] = to_value(std::forward<T>(value));
    return *this;
}

template <typename T>
Arguments&& Arguments::with(std::string name, T&& value) && {
    keywords[std::move(name)] = to_value(std::forward<T>(value));
    return std::move(*this);
}

/**
 * @brief Readable name of the type held by a Value, for error messages.
 */
std::string describe(const Value& value);

} // namespace callguard
