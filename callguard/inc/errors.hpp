// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>

namespace callguard {

/**
 * @brief Base class of all errors raised by the callback guarantee machinery.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Exception thrown when a decorated callable has no parameter with the
 *        requested callback name.
 *
 * Raised on the first invocation of the decorated callable, before its body runs.
 */
class UnknownArgument : public Error {
public:
    UnknownArgument(const std::string& callable, const std::string& argument)
        : Error("Wrapped function '" + callable + "' has no parameter '" + argument + "'"),
          callable_(callable), argument_(argument) {}

    [[nodiscard]] const std::string& callable() const { return callable_; }
    [[nodiscard]] const std::string& argument() const { return argument_; }

private:
    std::string callable_;
    std::string argument_;
};

/**
 * @brief Exception thrown when release() receives something other than a GuardedProxy.
 */
class NotAGuardedCallback : public Error {
public:
    explicit NotAGuardedCallback(const std::string& type)
        : Error("Cannot release a value which is not a guarded callback (got " + type + ")"),
          type_(type) {}

    [[nodiscard]] const std::string& type() const { return type_; }

private:
    std::string type_;
};

/**
 * @brief Exception thrown on a second explicit call through a GuardedProxy
 *        when the guard rejects double invocation.
 */
class AlreadyInvoked : public Error {
public:
    explicit AlreadyInvoked(const std::string& callable)
        : Error("Callback guarded by '" + callable + "' has already been invoked"),
          callable_(callable) {}

    [[nodiscard]] const std::string& callable() const { return callable_; }

private:
    std::string callable_;
};

/**
 * @brief Exception thrown when call arguments cannot be bound to a CallableSignature.
 */
class BindError : public Error {
public:
    BindError(const std::string& callable, const std::string& reason)
        : Error(callable + "(): " + reason), callable_(callable) {}

    [[nodiscard]] const std::string& callable() const { return callable_; }

private:
    std::string callable_;
};

} // namespace callguard
