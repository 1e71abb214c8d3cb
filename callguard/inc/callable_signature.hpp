// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "arguments.hpp"
#include "errors.hpp"

#include <any>
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace callguard {

/**
 * @brief How a parameter accepts arguments.
 */
enum class ParameterKind {
    PositionalOrKeyword, ///< Filled by position or by name
    VarPositional,       ///< Collects surplus positional arguments
    KeywordOnly,         ///< Filled by name only
    VarKeyword           ///< Collects surplus keyword arguments
};

/**
 * @brief One declared parameter of a callable.
 */
struct Parameter {
    std::string name;
    ParameterKind kind = ParameterKind::PositionalOrKeyword;
    std::optional<Value> default_value;

    [[nodiscard]] bool is_named_slot() const {
        return kind == ParameterKind::PositionalOrKeyword || kind == ParameterKind::KeywordOnly;
    }
};

/// Shorthand constructors for parameter declarations.
Parameter param(std::string name);
Parameter keyword_only(std::string name);
Parameter var_positional(std::string name);
Parameter var_keyword(std::string name);

template <typename T>
Parameter param(std::string name, T&& default_value) {
    return Parameter{std::move(name), ParameterKind::PositionalOrKeyword,
                     to_value(std::forward<T>(default_value))};
}

template <typename T>
Parameter keyword_only(std::string name, T&& default_value) {
    return Parameter{std::move(name), ParameterKind::KeywordOnly,
                     to_value(std::forward<T>(default_value))};
}

class BoundArguments;

/**
 * @brief Explicit descriptor of a callable: its name and ordered parameters.
 *
 * Stands in for signature introspection. Arguments are bound to parameter
 * names following the usual calling convention: positional arguments fill
 * positional-or-keyword parameters in order, keywords match by name, missing
 * parameters take their defaults, surplus values go to the variadic collectors.
 */
class CallableSignature {
public:
    CallableSignature(std::string name, std::vector<Parameter> parameters);

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::vector<Parameter>& parameters() const { return parameters_; }

    /**
     * @brief Find a parameter by name.
     *
     * @return Index in declaration order, or nullopt if not declared
     */
    [[nodiscard]] std::optional<size_t> find(const std::string& name) const;

    /**
     * @brief Bind call arguments to parameter names and apply defaults.
     *
     * @throws BindError on too many positionals, unexpected or duplicated
     *         keywords, or missing required parameters
     */
    [[nodiscard]] BoundArguments bind(Arguments args) const;

private:
    std::string name_;
    std::vector<Parameter> parameters_;
};

/**
 * @brief Result of binding Arguments to a CallableSignature.
 *
 * Values of named parameters are kept in declaration order. Surplus positional
 * and keyword arguments are kept apart when the signature declares collectors.
 */
class BoundArguments {
public:
    [[nodiscard]] const std::string& callable() const { return callable_; }

    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @brief Value bound to a named parameter.
     * @throws BindError if no parameter of that name was bound
     */
    [[nodiscard]] const Value& get(const std::string& name) const;

    /**
     * @brief Typed access to a bound value.
     * @throws BindError if missing or holding another type
     */
    template <typename T>
    [[nodiscard]] T at(const std::string& name) const;

    /**
     * @brief Replace the value bound to a named parameter.
     * @throws BindError if no parameter of that name was bound
     */
    void set(const std::string& name, Value value);

    [[nodiscard]] const std::vector<Value>& extra_positional() const { return extra_positional_; }
    [[nodiscard]] const std::map<std::string, Value>& extra_keywords() const {
        return extra_keywords_;
    }

    /**
     * @brief Convert back to call arguments.
     *
     * Positional-or-keyword values become positionals, followed by the surplus
     * positionals; keyword-only values and surplus keywords become keywords.
     */
    [[nodiscard]] Arguments to_arguments() const;

private:
    friend class CallableSignature;

    struct Slot {
        std::string name;
        ParameterKind kind;
        Value value;
    };

    [[nodiscard]] const Slot* find_slot(const std::string& name) const;

    std::string callable_;
    std::vector<Slot> slots_;
    std::vector<Value> extra_positional_;
    std::map<std::string, Value> extra_keywords_;
};

template <typename T>
T BoundArguments::at(const std::string& name) const {
    const Value& value = get(name);
    if (const T* typed = std::any_cast<T>(&value)) {
        return *typed;
    }
    throw BindError(callable_, "argument '" + name + "' holds " + describe(value));
}

} // namespace callguard
