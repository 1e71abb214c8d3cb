// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "arguments.hpp"
#include "async_sequence.hpp"
#include "callable_signature.hpp"
#include "callback_guard.hpp"
#include "obligation.hpp"
#include "sequence.hpp"

#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/asio/awaitable.hpp>

namespace callguard {

/// Asynchronous unit of work.
using Task = boost::asio::awaitable<Value>;

using FunctionBody = std::function<Value(BoundArguments&)>;

/// Coroutine bodies take the bound arguments by value so they live in the frame.
using SequenceBody = std::function<Sequence(BoundArguments)>;
using TaskBody = std::function<Task(BoundArguments)>;
using AsyncSequenceBody = std::function<AsyncSequence(BoundArguments)>;

/**
 * @brief Per-decoration configuration shared by the execution shapes.
 */
class DecoratedCall {
public:
    DecoratedCall(CallableSignature signature, std::string argument, Arguments fallback,
                  std::optional<DoubleInvokePolicy> policy);

    [[nodiscard]] const CallableSignature& signature() const { return signature_; }
    [[nodiscard]] const std::string& argument() const { return argument_; }
    [[nodiscard]] const Arguments& fallback() const { return fallback_; }

protected:
    /**
     * @brief Locate the callback slot and bind the call's arguments.
     *
     * @throws UnknownArgument if the callable has no such parameter
     * @throws BindError if the arguments do not match the signature
     */
    [[nodiscard]] BoundArguments bind(Arguments args) const;

    /**
     * @brief Guard the bound callback and take on this call's obligation.
     *
     * Reuses the guard of an incoming GuardedProxy (re-obligating it with this
     * call's fallback) or creates a new one, then substitutes a fresh proxy
     * into the callback slot.
     *
     * @throws BindError if the slot holds neither a Callback nor a GuardedProxy
     */
    [[nodiscard]] Obligation enter(BoundArguments& bound) const;

private:
    CallableSignature signature_;
    std::string argument_;
    Arguments fallback_;
    std::optional<DoubleInvokePolicy> policy_;
};

/**
 * @brief Decorated plain call.
 *
 * The fallback fires after the body returns, or during unwinding before the
 * body's exception reaches the caller.
 */
class DecoratedFunction : public DecoratedCall {
public:
    DecoratedFunction(DecoratedCall call, FunctionBody body)
        : DecoratedCall(std::move(call)), body_(std::move(body)) {}

    Value operator()(Arguments args) const;

    template <typename... Ts>
    Value call(Ts&&... values) const {
        return (*this)(Arguments::of(std::forward<Ts>(values)...));
    }

private:
    FunctionBody body_;
};

/**
 * @brief Decorated lazy sequence.
 *
 * Arguments are bound when called; the fallback fires after the last element,
 * before a body error reaches the consumer, or when the sequence is closed or
 * destroyed early. The decorated object must outlive the sequences it returns.
 */
class DecoratedSequence : public DecoratedCall {
public:
    DecoratedSequence(DecoratedCall call, SequenceBody body)
        : DecoratedCall(std::move(call)), body_(std::move(body)) {}

    Sequence operator()(Arguments args) const;

    template <typename... Ts>
    Sequence call(Ts&&... values) const {
        return (*this)(Arguments::of(std::forward<Ts>(values)...));
    }

private:
    SequenceBody body_;
};

/**
 * @brief Decorated asynchronous unit of work.
 *
 * Arguments are bound when called; the fallback fires once the awaited body
 * settles, before the awaiting caller resumes. Cancellation (an aborted wait
 * inside the body, or destruction of the suspended task) fires it as well.
 * The decorated object must outlive the tasks it returns.
 */
class DecoratedTask : public DecoratedCall {
public:
    DecoratedTask(DecoratedCall call, TaskBody body)
        : DecoratedCall(std::move(call)), body_(std::move(body)) {}

    Task operator()(Arguments args) const;

    template <typename... Ts>
    Task call(Ts&&... values) const {
        return (*this)(Arguments::of(std::forward<Ts>(values)...));
    }

private:
    TaskBody body_;
};

/**
 * @brief Decorated asynchronous sequence.
 *
 * The body runs when called and returns the sequence; its producer should
 * capture whatever bound arguments it needs. The fallback fires after next()
 * reports the end, before a producer error reaches the consumer, or when the
 * sequence is closed or destroyed early.
 */
class DecoratedAsyncSequence : public DecoratedCall {
public:
    DecoratedAsyncSequence(DecoratedCall call, AsyncSequenceBody body)
        : DecoratedCall(std::move(call)), body_(std::move(body)) {}

    AsyncSequence operator()(Arguments args) const;

    template <typename... Ts>
    AsyncSequence call(Ts&&... values) const {
        return (*this)(Arguments::of(std::forward<Ts>(values)...));
    }

private:
    AsyncSequenceBody body_;
};

/**
 * @brief Decorator guaranteeing that the callback argument `argument` of the
 *        decorated body is called exactly once.
 *
 * The callback is called with the fallback arguments when the decorated body
 * finishes, unless:
 *   - the body called it explicitly (directly or through a nested decorated call)
 *   - a nested decorated call already fired the fallback
 *   - the callback has been released (see release())
 *
 * The execution shape follows the body's return type: Sequence, Task,
 * AsyncSequence, or any other value (including void) for a plain call.
 */
class Decorator {
public:
    Decorator(std::string argument, Arguments fallback);

    /// Guards created by this decorator use `policy` on a second explicit call.
    [[nodiscard]] Decorator with_policy(DoubleInvokePolicy policy) const;

    template <typename Body>
    auto operator()(CallableSignature signature, Body body) const {
        using Result = std::invoke_result_t<Body&, BoundArguments&>;
        DecoratedCall call(std::move(signature), argument_, fallback_, policy_);

        if constexpr (std::is_same_v<Result, Sequence>) {
            static_assert(std::is_invocable_r_v<Sequence, Body&, BoundArguments&&>,
                          "sequence bodies must take BoundArguments by value");
            return DecoratedSequence(std::move(call), SequenceBody(std::move(body)));
        } else if constexpr (std::is_same_v<Result, Task>) {
            static_assert(std::is_invocable_r_v<Task, Body&, BoundArguments&&>,
                          "task bodies must take BoundArguments by value");
            return DecoratedTask(std::move(call), TaskBody(std::move(body)));
        } else if constexpr (std::is_same_v<Result, AsyncSequence>) {
            static_assert(std::is_invocable_r_v<AsyncSequence, Body&, BoundArguments&&>,
                          "async sequence bodies must take BoundArguments by value");
            return DecoratedAsyncSequence(std::move(call), AsyncSequenceBody(std::move(body)));
        } else if constexpr (std::is_void_v<Result>) {
            return DecoratedFunction(std::move(call),
                                     [body = std::move(body)](BoundArguments& bound) mutable {
                                         body(bound);
                                         return Value{};
                                     });
        } else {
            return DecoratedFunction(std::move(call),
                                     [body = std::move(body)](BoundArguments& bound) mutable {
                                         return to_value(body(bound));
                                     });
        }
    }

    [[nodiscard]] const std::string& argument() const { return argument_; }
    [[nodiscard]] const Arguments& fallback() const { return fallback_; }

private:
    std::string argument_;
    Arguments fallback_;
    std::optional<DoubleInvokePolicy> policy_;
};

/**
 * @brief Create a decorator for the callback parameter named `argument`.
 *
 * The parameter is looked up on every call, so a misspelled name raises
 * UnknownArgument on the first call of the decorated body, not here.
 *
 * @param argument Name of the callback parameter
 * @param fallback Positional and keyword arguments for the fallback call
 */
[[nodiscard]] Decorator decorate(std::string argument, Arguments fallback = {});

/// Shorthand taking positional fallback values.
template <typename T, typename... Ts>
[[nodiscard]] Decorator decorate(std::string argument, T&& first, Ts&&... rest) {
    return Decorator(std::move(argument),
                     Arguments::of(std::forward<T>(first), std::forward<Ts>(rest)...));
}

} // namespace callguard
