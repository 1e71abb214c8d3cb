// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "callable_signature.hpp"

#include <algorithm>
#include <unordered_set>

namespace callguard {

Parameter param(std::string name) {
    return Parameter{std::move(name), ParameterKind::PositionalOrKeyword, std::nullopt};
}

Parameter keyword_only(std::string name) {
    return Parameter{std::move(name), ParameterKind::KeywordOnly, std::nullopt};
}

Parameter var_positional(std::string name) {
    return Parameter{std::move(name), ParameterKind::VarPositional, std::nullopt};
}

Parameter var_keyword(std::string name) {
    return Parameter{std::move(name), ParameterKind::VarKeyword, std::nullopt};
}

CallableSignature::CallableSignature(std::string name, std::vector<Parameter> parameters)
    : name_(std::move(name)), parameters_(std::move(parameters)) {
    std::unordered_set<std::string> seen;
    bool has_var_positional = false;
    bool has_var_keyword = false;

    for (const auto& parameter : parameters_) {
        if (!seen.insert(parameter.name).second) {
            throw BindError(name_, "duplicate parameter '" + parameter.name + "'");
        }
        if (parameter.kind == ParameterKind::VarPositional) {
            if (has_var_positional) {
                throw BindError(name_, "more than one variadic positional parameter");
            }
            has_var_positional = true;
        } else if (parameter.kind == ParameterKind::VarKeyword) {
            if (has_var_keyword) {
                throw BindError(name_, "more than one variadic keyword parameter");
            }
            has_var_keyword = true;
        }
    }
}

std::optional<size_t> CallableSignature::find(const std::string& name) const {
    auto it = std::find_if(parameters_.begin(), parameters_.end(),
                           [&name](const Parameter& p) { return p.name == name; });
    if (it == parameters_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(parameters_.begin(), it));
}

BoundArguments CallableSignature::bind(Arguments args) const {
    BoundArguments bound;
    bound.callable_ = name_;

    std::vector<std::optional<Value>> values(parameters_.size());
    const Parameter* var_positional_param = nullptr;
    const Parameter* var_keyword_param = nullptr;

    // Positional arguments fill positional-or-keyword parameters in order
    size_t next_positional = 0;
    for (size_t idx = 0; idx < parameters_.size(); ++idx) {
        const auto& parameter = parameters_[idx];
        if (parameter.kind == ParameterKind::VarPositional) {
            var_positional_param = &parameter;
            continue;
        }
        if (parameter.kind == ParameterKind::VarKeyword) {
            var_keyword_param = &parameter;
            continue;
        }
        if (parameter.kind == ParameterKind::PositionalOrKeyword && var_positional_param == nullptr &&
            next_positional < args.positional.size()) {
            values[idx] = std::move(args.positional[next_positional++]);
        }
    }

    if (next_positional < args.positional.size()) {
        if (var_positional_param == nullptr) {
            throw BindError(name_, "takes " + std::to_string(next_positional) +
                                       " positional arguments but " +
                                       std::to_string(args.positional.size()) + " were given");
        }
        for (size_t idx = next_positional; idx < args.positional.size(); ++idx) {
            bound.extra_positional_.push_back(std::move(args.positional[idx]));
        }
    }

    // Keywords match named parameters or fall into the keyword collector
    for (auto& [key, value] : args.keywords) {
        auto idx = find(key);
        if (idx.has_value() && parameters_[*idx].is_named_slot()) {
            if (values[*idx].has_value()) {
                throw BindError(name_, "got multiple values for argument '" + key + "'");
            }
            values[*idx] = std::move(value);
            continue;
        }
        if (var_keyword_param == nullptr) {
            throw BindError(name_, "got an unexpected keyword argument '" + key + "'");
        }
        bound.extra_keywords_[key] = std::move(value);
    }

    // Apply defaults and check required parameters
    for (size_t idx = 0; idx < parameters_.size(); ++idx) {
        const auto& parameter = parameters_[idx];
        if (!parameter.is_named_slot()) {
            continue;
        }
        if (!values[idx].has_value()) {
            if (!parameter.default_value.has_value()) {
                throw BindError(name_, "missing required argument '" + parameter.name + "'");
            }
            values[idx] = *parameter.default_value;
        }
        bound.slots_.push_back({parameter.name, parameter.kind, std::move(*values[idx])});
    }

    return bound;
}

const BoundArguments::Slot* BoundArguments::find_slot(const std::string& name) const {
    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [&name](const Slot& slot) { return slot.name == name; });
    return it == slots_.end() ? nullptr : &*it;
}

bool BoundArguments::contains(const std::string& name) const {
    return find_slot(name) != nullptr;
}

const Value& BoundArguments::get(const std::string& name) const {
    if (const Slot* slot = find_slot(name)) {
        return slot->value;
    }
    throw BindError(callable_, "no bound argument '" + name + "'");
}

void BoundArguments::set(const std::string& name, Value value) {
    auto it = std::find_if(slots_.begin(), slots_.end(),
                           [&name](const Slot& slot) { return slot.name == name; });
    if (it == slots_.end()) {
        throw BindError(callable_, "no bound argument '" + name + "'");
    }
    it->value = std::move(value);
}

Arguments BoundArguments::to_arguments() const {
    Arguments args;
    for (const auto& slot : slots_) {
        if (slot.kind == ParameterKind::PositionalOrKeyword) {
            args.positional.push_back(slot.value);
        } else {
            args.keywords[slot.name] = slot.value;
        }
    }
    args.positional.insert(args.positional.end(), extra_positional_.begin(),
                           extra_positional_.end());
    for (const auto& [key, value] : extra_keywords_) {
        args.keywords[key] = value;
    }
    return args;
}

} // namespace callguard
